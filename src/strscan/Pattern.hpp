#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <string>

namespace re2
{
class RE2;
}

namespace strscan
{

struct PatternOptions
{
    bool case_sensitive = true;
    bool longest_match = false; // leftmost-longest instead of leftmost-first
    bool dot_nl = false;
    int64_t max_mem = 8 << 20;
};

/**
 * @brief Compiled regular expression
 *
 * Immutable once built; copies share the compiled program, so a Pattern can be
 * passed around by value and reused across scanners and threads.
 *
 * The text is matched as UTF-8, but RE2's \w, \d, \s and \b only know ASCII:
 * "\w+" stops at the first non-ASCII letter. Use \p{L}, \p{N} or a class such
 * as [\p{L}\p{N}_] to match letters and digits from other scripts.
 */
class Pattern
{
public:
    /**
     * @brief Compile a pattern in RE2 syntax
     * @throws InvalidPatternError if the source does not compile
     */
    static Pattern FromString(const std::string& source, const PatternOptions& options = {});

    const std::string& Source() const;

    /// Number of capturing groups, not counting the whole match.
    int GroupCount() const;

    /// Named group -> group index (1-based).
    const std::map<std::string, int>& NamedGroups() const;

    /// Group index -> name, for named groups only.
    const std::map<int, std::string>& GroupNames() const;

    const re2::RE2& Program() const { return *re_; }

private:
    explicit Pattern(std::shared_ptr<const re2::RE2> re);

    std::shared_ptr<const re2::RE2> re_;
};

} // namespace strscan
