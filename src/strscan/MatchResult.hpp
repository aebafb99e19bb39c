#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace strscan
{

/// A capturing group's text; nullopt when the group did not take part in the match.
using Capture = std::optional<std::string>;

/**
 * @brief Outcome of one successful match attempt
 *
 * Offsets are in characters. groups holds capturing groups 1..n; the whole
 * match is `value`. named_groups maps each group name to its 1-based index.
 */
struct MatchResult
{
    std::size_t start = 0;
    std::size_t end = 0;
    std::string value;
    std::vector<Capture> groups;
    std::map<std::string, int> named_groups;

    std::size_t Length() const { return end - start; }

    /// Number of slots addressable by index, the whole match included.
    std::size_t SlotCount() const { return groups.size() + 1; }

    /// Maps a possibly negative index onto [0, SlotCount()); nullopt if out of range.
    std::optional<std::size_t> ResolveIndex(int index) const;

    std::optional<std::size_t> IndexOf(const std::string& name) const;

    /// slot must be < SlotCount(); slot 0 is the whole match.
    Capture At(std::size_t slot) const;
};

} // namespace strscan
