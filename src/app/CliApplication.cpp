#include "CliApplication.hpp"
#include "strscan/Scanner.hpp"
#include "strscan/ScannerErrors.hpp"
#include "utils/ErrorReporter.hpp"

#include <charconv>
#include <fstream>
#include <limits>
#include <map>
#include <ostream>
#include <sstream>
#include <stdexcept>

#include <nlohmann/json.hpp>
#include <plog/Log.h>

using json = nlohmann::json;

namespace
{

// Exit code 2: the command line itself is wrong
class UsageError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// op name -> takes an argument
const std::map<std::string, bool>& OpTable()
{
    static const std::map<std::string, bool> table = {
        { "scan", true },       { "check", true },      { "skip", true },        { "match", true },
        { "scan-until", true }, { "check-until", true }, { "skip-until", true }, { "exist", true },
        { "read", true },       { "peek", true },       { "pos", true },         { "group", true },
        { "reset", false },     { "terminate", false }, { "rest", false },       { "captures", false },
        { "named", false },     { "pre", false },       { "post", false },       { "inspect", false },
    };
    return table;
}

std::optional<long long> ParseInteger(const std::string& s)
{
    long long value = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc() || ptr != s.data() + s.size())
        return std::nullopt;
    return value;
}

long long RequireInteger(const std::string& op, const std::string& arg)
{
    auto value = ParseInteger(arg);
    if (!value)
        throw UsageError(op + " expects an integer, got '" + arg + "'");
    return *value;
}

std::size_t RequireCount(const std::string& op, const std::string& arg)
{
    long long value = RequireInteger(op, arg);
    if (value < 0)
        throw UsageError(op + " expects a non-negative count, got '" + arg + "'");
    return static_cast<std::size_t>(value);
}

json ToJson(const std::optional<std::string>& value)
{
    return value ? json(*value) : json(nullptr);
}

json ToJson(const std::optional<std::size_t>& value)
{
    return value ? json(*value) : json(nullptr);
}

json ToJson(const std::optional<std::vector<strscan::Capture>>& captures)
{
    if (!captures)
        return nullptr;
    json arr = json::array();
    for (const auto& capture : *captures)
        arr.push_back(ToJson(capture));
    return arr;
}

json ToJson(const std::optional<std::map<std::string, strscan::Capture>>& captures)
{
    if (!captures)
        return nullptr;
    json obj = json::object();
    for (const auto& [name, capture] : *captures)
        obj[name] = ToJson(capture);
    return obj;
}

} // namespace

CliApplication::CliApplication(std::vector<std::string> args, std::ostream& out, std::ostream& err)
    : args_(std::move(args))
    , out_(out)
    , err_(err)
{
}

void CliApplication::printUsage(std::ostream& os)
{
    os << "usage: strscan [--config FILE] [--json|--text] [--file PATH | TEXT] OP [ARG] ...\n"
          "\n"
          "anchored:      scan P, check P, skip P, match P\n"
          "search-ahead:  scan-until P, check-until P, skip-until P, exist P\n"
          "cursor:        read N, peek N, pos N, reset, terminate, rest\n"
          "register:      group I|NAME, captures, named, pre, post\n"
          "other:         inspect\n";
}

void CliApplication::parseArguments()
{
    std::size_t i = 0;
    for (; i < args_.size(); ++i)
    {
        const std::string& arg = args_[i];
        if (arg == "--help" || arg == "-h")
        {
            help_requested_ = true;
            return;
        }
        if (arg == "--json")
        {
            output_override_ = OutputFormat::Json;
        }
        else if (arg == "--text")
        {
            output_override_ = OutputFormat::Text;
        }
        else if (arg == "--config" || arg == "--file")
        {
            if (i + 1 >= args_.size())
                throw UsageError(arg + " needs a value");
            if (arg == "--config")
                config_path_ = args_[++i];
            else
                file_path_ = args_[++i];
        }
        else if (arg == "--")
        {
            ++i;
            break;
        }
        else
        {
            break;
        }
    }

    if (!file_path_)
    {
        if (i >= args_.size())
            throw UsageError("missing TEXT");
        inline_text_ = args_[i++];
    }

    while (i < args_.size())
    {
        const std::string& op = args_[i++];
        auto it = OpTable().find(op);
        if (it == OpTable().end())
            throw UsageError("unknown operation '" + op + "'");

        Step step{ op, std::nullopt };
        if (it->second)
        {
            if (i >= args_.size())
                throw UsageError(op + " needs an argument");
            step.arg = args_[i++];
        }
        steps_.push_back(std::move(step));
    }
}

std::optional<std::string> CliApplication::loadText()
{
    if (inline_text_)
        return inline_text_;

    std::ifstream ifs(*file_path_, std::ios::binary);
    if (!ifs)
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Cli, "Cannot open input file", *file_path_);
        return std::nullopt;
    }
    std::stringstream buffer;
    buffer << ifs.rdbuf();
    return buffer.str();
}

int CliApplication::run()
{
    try
    {
        parseArguments();
    }
    catch (const UsageError& ex)
    {
        err_ << "strscan: " << ex.what() << "\n";
        printUsage(err_);
        return 2;
    }

    if (help_requested_)
    {
        printUsage(out_);
        return 0;
    }

    ConfigManager config(config_path_);
    if (!config.load())
    {
        PLOG_WARNING << "Continuing with default settings: " << config.lastError();
    }
    output_ = output_override_.value_or(config.cliSettings().output);

    auto text = loadText();
    if (!text)
    {
        flushReports();
        return 1;
    }

    int exit_code = 0;
    try
    {
        strscan::Scanner scanner(std::move(*text), config.scannerOptions());
        for (const auto& step : steps_)
        {
            json result = execute(step, scanner);
            emit(step, result, scanner);
        }
    }
    catch (const UsageError& ex)
    {
        err_ << "strscan: " << ex.what() << "\n";
        exit_code = 2;
    }
    catch (const strscan::InvalidPatternError& ex)
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Pattern, "Pattern does not compile", ex.what());
        exit_code = 1;
    }
    catch (const strscan::ScannerError& ex)
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Cli, "Scanner rejected the request", ex.what());
        exit_code = 1;
    }

    flushReports();
    return exit_code;
}

json CliApplication::execute(const Step& step, strscan::Scanner& scanner)
{
    PLOG_DEBUG << "op " << step.op << (step.arg ? " " + *step.arg : std::string());

    const std::string& op = step.op;
    const std::string arg = step.arg.value_or("");

    if (op == "scan")
        return ToJson(scanner.Scan(arg));
    if (op == "check")
        return ToJson(scanner.Check(arg));
    if (op == "skip")
        return ToJson(scanner.Skip(arg));
    if (op == "match")
        return ToJson(scanner.MatchLength(arg));
    if (op == "scan-until")
        return ToJson(scanner.ScanUntil(arg));
    if (op == "check-until")
        return ToJson(scanner.CheckUntil(arg));
    if (op == "skip-until")
        return ToJson(scanner.SkipUntil(arg));
    if (op == "exist")
        return ToJson(scanner.Exist(arg));
    if (op == "read")
        return ToJson(scanner.Read(RequireCount(op, arg)));
    if (op == "peek")
        return scanner.Peek(RequireCount(op, arg));
    if (op == "pos")
    {
        scanner.SetPosition(RequireInteger(op, arg));
        return scanner.Position();
    }
    if (op == "group")
    {
        if (auto index = ParseInteger(arg))
        {
            if (*index < std::numeric_limits<int>::min() || *index > std::numeric_limits<int>::max())
                throw strscan::UnknownGroupError("no group at index " + arg);
            auto group = scanner.GroupAt(static_cast<int>(*index));
            return group ? ToJson(*group) : json(nullptr);
        }
        auto group = scanner.GroupAt(arg);
        return group ? ToJson(*group) : json(nullptr);
    }
    if (op == "reset")
    {
        scanner.Reset();
        return scanner.Position();
    }
    if (op == "terminate")
    {
        scanner.Terminate();
        return scanner.Position();
    }
    if (op == "rest")
        return scanner.Remainder();
    if (op == "captures")
        return ToJson(scanner.Captures());
    if (op == "named")
        return ToJson(scanner.NamedCaptures());
    if (op == "pre")
        return ToJson(scanner.PreMatch());
    if (op == "post")
        return ToJson(scanner.PostMatch());
    if (op == "inspect")
        return scanner.Inspect();

    throw UsageError("unknown operation '" + op + "'");
}

void CliApplication::emit(const Step& step, const json& result, const strscan::Scanner& scanner)
{
    if (output_ == OutputFormat::Json)
    {
        json line = {
            { "op", step.op },
            { "arg", step.arg ? json(*step.arg) : json(nullptr) },
            { "result", result },
            { "position", scanner.Position() },
            { "matched", scanner.Matched() },
        };
        out_ << line.dump() << "\n";
        return;
    }

    out_ << step.op;
    if (step.arg)
        out_ << " " << json(*step.arg).dump();
    out_ << " => " << (result.is_null() ? std::string("nil") : result.dump()) << "\n";
}

void CliApplication::flushReports()
{
    for (const auto& report : utils::ErrorReporter::GetPendingErrors())
    {
        err_ << utils::ErrorReporter::SeverityToString(report.severity) << ": ["
             << utils::ErrorReporter::CategoryToString(report.category) << "] " << report.user_message;
        if (!report.technical_details.empty())
            err_ << " (" << report.technical_details << ")";
        err_ << "\n";
    }
}
