#pragma once

#include "IPatternEngine.hpp"

namespace strscan
{

class Re2PatternEngine : public IPatternEngine
{
public:
    std::optional<EngineMatch> Match(const Pattern& pattern, std::string_view text, std::size_t start_byte,
                                     Anchor anchor) const override;
};

} // namespace strscan
