#include "Pattern.hpp"
#include "ScannerErrors.hpp"

#include <plog/Log.h>
#include <re2/re2.h>

namespace strscan
{

Pattern Pattern::FromString(const std::string& source, const PatternOptions& options)
{
    RE2::Options re_options;
    re_options.set_encoding(RE2::Options::EncodingUTF8);
    re_options.set_log_errors(false);
    re_options.set_case_sensitive(options.case_sensitive);
    re_options.set_longest_match(options.longest_match);
    re_options.set_dot_nl(options.dot_nl);
    re_options.set_max_mem(options.max_mem);

    auto re = std::make_shared<const RE2>(source, re_options);
    if (!re->ok())
    {
        PLOG_DEBUG << "Pattern compile failed: " << source << " (" << re->error() << ")";
        throw InvalidPatternError(source, re->error());
    }

    return Pattern(std::move(re));
}

Pattern::Pattern(std::shared_ptr<const re2::RE2> re)
    : re_(std::move(re))
{
}

const std::string& Pattern::Source() const { return re_->pattern(); }

int Pattern::GroupCount() const { return re_->NumberOfCapturingGroups(); }

const std::map<std::string, int>& Pattern::NamedGroups() const { return re_->NamedCapturingGroups(); }

const std::map<int, std::string>& Pattern::GroupNames() const { return re_->CapturingGroupNames(); }

} // namespace strscan
