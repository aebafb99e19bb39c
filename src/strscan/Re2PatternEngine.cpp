#include "Re2PatternEngine.hpp"

#include "../utils/Profile.hpp"

#include <re2/re2.h>

namespace strscan
{

std::optional<EngineMatch> Re2PatternEngine::Match(const Pattern& pattern, std::string_view text,
                                                   std::size_t start_byte, Anchor anchor) const
{
    PROFILE_SCOPE_FUNCTION();
    if (start_byte > text.size())
        return std::nullopt;

    const RE2& re = pattern.Program();
    const int nsubmatch = 1 + re.NumberOfCapturingGroups();
    std::vector<re2::StringPiece> submatch(static_cast<std::size_t>(nsubmatch));

    re2::StringPiece subject(text.data(), text.size());
    const RE2::Anchor re_anchor = anchor == Anchor::AnchorStart ? RE2::ANCHOR_START : RE2::UNANCHORED;

    if (!re.Match(subject, start_byte, text.size(), re_anchor, submatch.data(), nsubmatch))
        return std::nullopt;

    EngineMatch match;
    match.spans.reserve(submatch.size());
    for (const auto& piece : submatch)
    {
        // RE2 leaves non-participating groups as a null piece
        if (piece.data() == nullptr)
        {
            match.spans.emplace_back(std::nullopt);
            continue;
        }
        const auto begin = static_cast<std::size_t>(piece.data() - text.data());
        match.spans.push_back(ByteSpan{ begin, begin + piece.size() });
    }
    return match;
}

} // namespace strscan
