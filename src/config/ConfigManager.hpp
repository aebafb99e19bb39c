#pragma once

#include "../strscan/Scanner.hpp"

#include <memory>
#include <string>
#include <string_view>

#include <toml++/toml.h>

enum class OutputFormat
{
    Text,
    Json
};

struct CliSettings
{
    OutputFormat output = OutputFormat::Text;
};

/**
 * @brief Loads strscan.toml
 *
 * [engine] feeds ScannerOptions, [cli] feeds CliSettings. [logging] is read
 * separately by utils::LogManager since logging starts before this is loaded.
 * Unknown keys are ignored; invalid values fall back to their defaults.
 */
class ConfigManager
{
public:
    explicit ConfigManager(std::string config_path = "strscan.toml");
    ~ConfigManager();

    // A missing file is not an error: defaults apply.
    bool load();
    bool loadFromString(std::string_view content);

    const toml::table& root() const;
    const std::string& path() const { return config_path_; }

    const char* lastError() const { return last_error_.c_str(); }

    const strscan::ScannerOptions& scannerOptions() const { return scanner_options_; }
    const CliSettings& cliSettings() const { return cli_settings_; }

private:
    bool parse(std::string_view content, std::string_view source_name);
    void applyEngine(const toml::table& engine);
    void applyCli(const toml::table& cli);

    std::string config_path_;
    std::string last_error_;
    std::unique_ptr<toml::table> root_;
    strscan::ScannerOptions scanner_options_;
    CliSettings cli_settings_;
};
