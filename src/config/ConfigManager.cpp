#include "ConfigManager.hpp"
#include "../utils/ErrorReporter.hpp"

#include <plog/Log.h>
#include <fstream>
#include <sstream>

ConfigManager::ConfigManager(std::string config_path)
    : config_path_(std::move(config_path))
    , root_(std::make_unique<toml::table>())
{
}

ConfigManager::~ConfigManager() = default;

bool ConfigManager::load()
{
    last_error_.clear();
    std::ifstream ifs(config_path_, std::ios::binary);
    if (!ifs)
    {
        PLOG_DEBUG << "No config at " << config_path_ << ", using defaults";
        root_ = std::make_unique<toml::table>();
        return true;
    }

    std::stringstream buffer;
    buffer << ifs.rdbuf();
    return parse(buffer.str(), config_path_);
}

bool ConfigManager::loadFromString(std::string_view content)
{
    last_error_.clear();
    return parse(content, "<string>");
}

bool ConfigManager::parse(std::string_view content, std::string_view source_name)
{
    try
    {
        root_ = std::make_unique<toml::table>(toml::parse(content, source_name));
    }
    catch (const toml::parse_error& pe)
    {
        last_error_ = std::string("config parse error: ") + std::string(pe.description());
        PLOG_WARNING << last_error_;

        std::string error_details;
        if (pe.source().begin.line > 0)
        {
            error_details = "Error at line " + std::to_string(pe.source().begin.line) + ": " + std::string(pe.description());
        }
        else
        {
            error_details = std::string(pe.description());
        }

        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                            "Configuration file has errors. Using defaults.",
                                            error_details + "\nFile: " + std::string(source_name));
        return false;
    }

    scanner_options_ = strscan::ScannerOptions{};
    cli_settings_ = CliSettings{};

    if (auto engine = (*root_)["engine"].as_table())
        applyEngine(*engine);
    if (auto cli = (*root_)["cli"].as_table())
        applyCli(*cli);

    PLOG_INFO << "Config loaded from " << source_name;
    return true;
}

void ConfigManager::applyEngine(const toml::table& engine)
{
    auto& pattern = scanner_options_.pattern;

    if (auto v = engine["case_sensitive"].value<bool>())
        pattern.case_sensitive = *v;
    if (auto v = engine["longest_match"].value<bool>())
        pattern.longest_match = *v;
    if (auto v = engine["dot_nl"].value<bool>())
        pattern.dot_nl = *v;

    if (auto v = engine["max_mem"].value<int64_t>())
    {
        if (*v > 0)
        {
            pattern.max_mem = *v;
        }
        else
        {
            utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                                "engine.max_mem must be positive, keeping default",
                                                "value: " + std::to_string(*v));
        }
    }

    if (auto v = engine["cache_capacity"].value<int64_t>())
    {
        if (*v >= 0)
        {
            scanner_options_.cache_capacity = static_cast<std::size_t>(*v);
        }
        else
        {
            utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                                "engine.cache_capacity must not be negative, keeping default",
                                                "value: " + std::to_string(*v));
        }
    }
}

void ConfigManager::applyCli(const toml::table& cli)
{
    if (auto output = cli["output"].value<std::string>())
    {
        if (*output == "json")
        {
            cli_settings_.output = OutputFormat::Json;
        }
        else if (*output == "text")
        {
            cli_settings_.output = OutputFormat::Text;
        }
        else
        {
            utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                                "cli.output must be \"text\" or \"json\", keeping text",
                                                "value: " + *output);
        }
    }
}

const toml::table& ConfigManager::root() const
{
    static const toml::table empty;
    return root_ ? *root_ : empty;
}
