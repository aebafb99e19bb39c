#include "MatchResult.hpp"

namespace strscan
{

std::optional<std::size_t> MatchResult::ResolveIndex(int index) const
{
    const auto slots = static_cast<long long>(SlotCount());
    long long resolved = index < 0 ? slots + index : index;
    if (resolved < 0 || resolved >= slots)
        return std::nullopt;
    return static_cast<std::size_t>(resolved);
}

std::optional<std::size_t> MatchResult::IndexOf(const std::string& name) const
{
    auto it = named_groups.find(name);
    if (it == named_groups.end())
        return std::nullopt;
    return static_cast<std::size_t>(it->second);
}

Capture MatchResult::At(std::size_t slot) const
{
    if (slot == 0)
        return value;
    return groups[slot - 1];
}

} // namespace strscan
