#pragma once

#include "IPatternEngine.hpp"
#include "MatchResult.hpp"
#include "Pattern.hpp"
#include "PatternCache.hpp"
#include "../text/Utf8Index.hpp"

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace strscan
{

/// Looks up a named capture in the match register.
using CaptureLookup = std::function<Capture(const std::string& name)>;

/// Builds a result string out of the named captures of a successful match.
using CaptureTransform = std::function<std::string(const CaptureLookup& lookup)>;

struct ScannerOptions
{
    PatternOptions pattern;
    std::size_t cache_capacity = PatternCache::kDefaultCapacity;
    std::shared_ptr<const IPatternEngine> engine; // null selects Re2PatternEngine
};

/**
 * @brief Cursor over a UTF-8 string driven by regular-expression matches
 *
 * Keeps the text, a cursor measured in characters and a match register that
 * holds the result of the most recent match attempt. Every match attempt
 * replaces the register; a failed attempt clears it and leaves the cursor alone.
 *
 * Usage:
 *   strscan::Scanner s("3 + 42");
 *   while (!s.AtEndOfString()) {
 *       if (auto number = s.Scan("\\d+")) { ... }
 *       else if (auto op = s.Scan("[-+*]")) { ... }
 *       else s.Skip("\\s+");
 *   }
 *
 * Pattern sources passed as strings are compiled through a per-scanner cache.
 * Not thread-safe.
 */
class Scanner
{
public:
    /// @throws InvalidTextError if text is not valid UTF-8
    explicit Scanner(std::string text = "", ScannerOptions options = {});

    const std::string& Text() const { return text_; }

    /// Length of the text in characters.
    std::size_t Size() const { return index_.CharCount(); }

    /// Replaces the text, moves the cursor to 0 and clears the register.
    void SetText(std::string text);

    /// Appends to the text. Cursor and register are kept.
    void Concat(const std::string& more);

    // --- Cursor ---

    std::size_t Position() const { return position_; }
    std::size_t BytePosition() const { return index_.ByteOffset(position_); }

    /**
     * @brief Move the cursor; negative values count from the end
     * @throws OutOfRangeError outside [-Size(), Size()]
     */
    void SetPosition(long long position);

    bool AtStartOfString() const;
    bool AtEndOfString() const;
    bool AtStartOfLine() const;
    bool AtEndOfLine() const;

    std::string Remainder() const;
    std::size_t RemainderSize() const { return Size() - position_; }

    /// @throws OutOfRangeError if fewer than length characters remain
    std::string Peek(std::size_t length) const;

    /// Consumes length characters; clears the register whether or not it succeeds.
    std::optional<std::string> Read(std::size_t length = 1);

    void Reset();
    void Terminate();

    // --- Anchored matching: the match must start at the cursor ---

    std::optional<std::string> Scan(const Pattern& pattern);
    std::optional<std::string> Scan(const std::string& source);
    std::optional<std::string> Check(const Pattern& pattern);
    std::optional<std::string> Check(const std::string& source);
    std::optional<std::size_t> Skip(const Pattern& pattern);
    std::optional<std::size_t> Skip(const std::string& source);

    /// Length of the anchored match without moving the cursor.
    std::optional<std::size_t> MatchLength(const Pattern& pattern);
    std::optional<std::size_t> MatchLength(const std::string& source);

    // --- Search-ahead matching: leftmost match at or after the cursor ---

    std::optional<std::string> ScanUntil(const Pattern& pattern);
    std::optional<std::string> ScanUntil(const std::string& source);
    std::optional<std::string> CheckUntil(const Pattern& pattern);
    std::optional<std::string> CheckUntil(const std::string& source);
    std::optional<std::size_t> SkipUntil(const Pattern& pattern);
    std::optional<std::size_t> SkipUntil(const std::string& source);

    /// Distance from the cursor to the end of the next match, without moving.
    std::optional<std::size_t> Exist(const Pattern& pattern);
    std::optional<std::size_t> Exist(const std::string& source);

    // --- Capture transforms: on success the result is transform(named captures) ---

    std::optional<std::string> Scan(const Pattern& pattern, const CaptureTransform& transform);
    std::optional<std::string> Scan(const std::string& source, const CaptureTransform& transform);
    std::optional<std::string> Check(const Pattern& pattern, const CaptureTransform& transform);
    std::optional<std::string> Check(const std::string& source, const CaptureTransform& transform);
    std::optional<std::string> ScanUntil(const Pattern& pattern, const CaptureTransform& transform);
    std::optional<std::string> ScanUntil(const std::string& source, const CaptureTransform& transform);
    std::optional<std::string> CheckUntil(const Pattern& pattern, const CaptureTransform& transform);
    std::optional<std::string> CheckUntil(const std::string& source, const CaptureTransform& transform);

    // --- Match register ---
    // Every query returns nullopt while the register is empty.

    bool Matched() const { return last_match_.has_value(); }
    std::optional<std::string> MatchedString() const;
    std::optional<std::size_t> MatchedSize() const;
    const std::optional<MatchResult>& LastMatch() const { return last_match_; }

    /// @throws UnknownGroupError if the index is outside the matched pattern's groups
    std::optional<Capture> GroupAt(int index) const;
    /// @throws UnknownGroupError if the pattern has no group of that name
    std::optional<Capture> GroupAt(const std::string& name) const;

    std::optional<std::vector<Capture>> GroupsAt(const std::vector<int>& indices) const;
    std::optional<std::vector<Capture>> NamedGroupsAt(const std::vector<std::string>& names) const;

    std::optional<std::vector<Capture>> Captures() const;
    std::optional<std::map<std::string, Capture>> NamedCaptures() const;

    std::optional<std::string> PreMatch() const;
    std::optional<std::string> PostMatch() const;

    /// Short diagnostic form, e.g. #<Scanner 3/7 "tør" @ " bøf">
    std::string Inspect() const;

    PatternCache& Cache() { return cache_; }

private:
    bool Attempt(const Pattern& pattern, Anchor anchor);
    std::optional<MatchResult> BuildMatchResult(const Pattern& pattern, const EngineMatch& match, Anchor anchor,
                                                std::string& violation) const;
    std::optional<std::string> ApplyTransform(const CaptureTransform& transform) const;

    std::string Slice(std::size_t from, std::size_t to) const;
    void ClearMatch() { last_match_.reset(); }

    std::string text_;
    text::Utf8Index index_;
    std::size_t position_ = 0;
    std::optional<MatchResult> last_match_;

    std::shared_ptr<const IPatternEngine> engine_;
    PatternCache cache_;
};

} // namespace strscan
