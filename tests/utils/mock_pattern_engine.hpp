#pragma once

#include "strscan/IPatternEngine.hpp"

#include <cstddef>
#include <optional>
#include <string_view>
#include <utility>

namespace test_utils {

// Pattern engine that returns a canned result and records how it was called
class MockPatternEngine : public strscan::IPatternEngine {
public:
    // Result handed back by the next Match call
    void setResult(std::optional<strscan::EngineMatch> result) { result_ = std::move(result); }

    std::optional<strscan::EngineMatch> Match(const strscan::Pattern&, std::string_view, std::size_t start_byte,
                                              strscan::Anchor anchor) const override {
        ++calls_;
        last_start_byte_ = start_byte;
        last_anchor_ = anchor;
        return result_;
    }

    std::size_t calls() const { return calls_; }
    std::size_t lastStartByte() const { return last_start_byte_; }
    strscan::Anchor lastAnchor() const { return last_anchor_; }

private:
    std::optional<strscan::EngineMatch> result_;
    mutable std::size_t calls_ = 0;
    mutable std::size_t last_start_byte_ = 0;
    mutable strscan::Anchor last_anchor_ = strscan::Anchor::Unanchored;
};

// Whole-match span followed by optional group spans
inline strscan::EngineMatch makeMatch(std::size_t begin, std::size_t end) {
    strscan::EngineMatch match;
    match.spans.push_back(strscan::ByteSpan{begin, end});
    return match;
}

}  // namespace test_utils
