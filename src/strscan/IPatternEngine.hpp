#pragma once

#include "Pattern.hpp"

#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

namespace strscan
{

enum class Anchor
{
    Unanchored,  // leftmost match at or after the start offset
    AnchorStart  // match must begin exactly at the start offset
};

/// Half-open byte range into the subject text.
struct ByteSpan
{
    std::size_t begin = 0;
    std::size_t end = 0;
};

/// Raw engine result; spans[0] is the whole match, spans[i] group i.
/// A group that did not take part in the match is nullopt.
struct EngineMatch
{
    std::vector<std::optional<ByteSpan>> spans;
};

class IPatternEngine
{
public:
    virtual ~IPatternEngine() = default;

    // The text before start_byte is context only (for \b, ^, \A); no match may begin there.
    virtual std::optional<EngineMatch> Match(const Pattern& pattern, std::string_view text, std::size_t start_byte,
                                             Anchor anchor) const = 0;
};

} // namespace strscan
