#pragma once

#include "config/ConfigManager.hpp"

#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace strscan
{
class Scanner;
}

/**
 * @brief Command line front end
 *
 *   strscan [--config FILE] [--json|--text] [--file PATH | TEXT] OP [ARG] ...
 *
 * Runs each OP against one scanner and prints one line per OP.
 * Exit codes: 0 success, 1 contract violation or unreadable input, 2 usage error.
 */
class CliApplication
{
public:
    CliApplication(std::vector<std::string> args, std::ostream& out, std::ostream& err);

    int run();

    static void printUsage(std::ostream& os);

private:
    struct Step
    {
        std::string op;
        std::optional<std::string> arg;
    };

    void parseArguments();
    std::optional<std::string> loadText();
    nlohmann::json execute(const Step& step, strscan::Scanner& scanner);
    void emit(const Step& step, const nlohmann::json& result, const strscan::Scanner& scanner);
    void flushReports();

    std::vector<std::string> args_;
    std::ostream& out_;
    std::ostream& err_;

    std::string config_path_ = "strscan.toml";
    std::optional<OutputFormat> output_override_;
    std::optional<std::string> file_path_;
    std::optional<std::string> inline_text_;
    std::vector<Step> steps_;
    bool help_requested_ = false;

    OutputFormat output_ = OutputFormat::Text;
};
