#include "Scanner.hpp"
#include "Re2PatternEngine.hpp"
#include "ScannerErrors.hpp"
#include "../utils/ErrorReporter.hpp"

#include <utility>

namespace strscan
{

namespace
{

text::Utf8Index BuildIndex(const std::string& text)
{
    auto index = text::Utf8Index::Build(text);
    if (!index)
        throw InvalidTextError("text is not valid UTF-8");
    return std::move(*index);
}

std::string EscapeForInspect(const std::string& s)
{
    std::string out;
    out.reserve(s.size());
    for (char c : s)
    {
        switch (c)
        {
        case '\n':
            out += "\\n";
            break;
        case '\t':
            out += "\\t";
            break;
        case '\r':
            out += "\\r";
            break;
        case '"':
            out += "\\\"";
            break;
        case '\\':
            out += "\\\\";
            break;
        default:
            out += c;
        }
    }
    return out;
}

constexpr std::size_t kInspectWindow = 5;

} // namespace

Scanner::Scanner(std::string text, ScannerOptions options)
    : text_(std::move(text))
    , index_(BuildIndex(text_))
    , engine_(options.engine ? std::move(options.engine) : std::make_shared<Re2PatternEngine>())
    , cache_(options.pattern, options.cache_capacity)
{
}

void Scanner::SetText(std::string text)
{
    index_ = BuildIndex(text);
    text_ = std::move(text);
    position_ = 0;
    ClearMatch();
}

void Scanner::Concat(const std::string& more)
{
    if (!index_.Append(more))
        throw InvalidTextError("appended text is not valid UTF-8");
    text_ += more;
}

void Scanner::SetPosition(long long position)
{
    const auto size = static_cast<long long>(Size());
    long long resolved = position < 0 ? position + size : position;
    if (resolved < 0 || resolved > size)
    {
        throw OutOfRangeError("position " + std::to_string(position) + " outside text of " + std::to_string(size) +
                              " characters");
    }
    position_ = static_cast<std::size_t>(resolved);
    ClearMatch();
}

bool Scanner::AtStartOfString() const { return position_ == 0; }

bool Scanner::AtEndOfString() const { return position_ == Size(); }

bool Scanner::AtStartOfLine() const
{
    // '\n' never appears inside a multi-byte sequence, so the previous byte is enough
    return position_ == 0 || text_[BytePosition() - 1] == '\n';
}

bool Scanner::AtEndOfLine() const { return AtEndOfString() || text_[BytePosition()] == '\n'; }

std::string Scanner::Remainder() const { return text_.substr(BytePosition()); }

std::string Scanner::Peek(std::size_t length) const
{
    if (length > RemainderSize())
    {
        throw OutOfRangeError("cannot peek " + std::to_string(length) + " characters with " +
                              std::to_string(RemainderSize()) + " remaining");
    }
    return Slice(position_, position_ + length);
}

std::optional<std::string> Scanner::Read(std::size_t length)
{
    ClearMatch();
    if (length > RemainderSize())
        return std::nullopt;

    std::string result = Slice(position_, position_ + length);
    position_ += length;
    return result;
}

void Scanner::Reset()
{
    position_ = 0;
    ClearMatch();
}

void Scanner::Terminate()
{
    position_ = Size();
    ClearMatch();
}

// --- Matching core ---

bool Scanner::Attempt(const Pattern& pattern, Anchor anchor)
{
    ClearMatch();

    auto match = engine_->Match(pattern, text_, BytePosition(), anchor);
    if (!match)
        return false;

    std::string violation;
    auto result = BuildMatchResult(pattern, *match, anchor, violation);
    if (!result)
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Engine, "Matching engine returned an unusable match",
                                            "pattern '" + pattern.Source() + "': " + violation);
        return false;
    }

    last_match_ = std::move(result);
    return true;
}

std::optional<MatchResult> Scanner::BuildMatchResult(const Pattern& pattern, const EngineMatch& match, Anchor anchor,
                                                     std::string& violation) const
{
    const std::size_t expected_slots = static_cast<std::size_t>(pattern.GroupCount()) + 1;
    if (match.spans.size() != expected_slots || !match.spans[0])
    {
        violation = "expected " + std::to_string(expected_slots) + " spans with a whole-match span, got " +
                    std::to_string(match.spans.size());
        return std::nullopt;
    }

    auto to_chars = [this](const ByteSpan& span) -> std::optional<std::pair<std::size_t, std::size_t>>
    {
        if (span.begin > span.end || span.end > text_.size())
            return std::nullopt;
        auto begin = index_.CharOffset(span.begin);
        auto end = index_.CharOffset(span.end);
        if (!begin || !end)
            return std::nullopt;
        return std::make_pair(*begin, *end);
    };

    auto whole = to_chars(*match.spans[0]);
    if (!whole)
    {
        violation = "whole-match span is out of range or not on a character boundary";
        return std::nullopt;
    }
    if (whole->first < position_)
    {
        violation = "match starts at " + std::to_string(whole->first) + ", before the cursor at " +
                    std::to_string(position_);
        return std::nullopt;
    }
    if (anchor == Anchor::AnchorStart && whole->first != position_)
    {
        violation = "anchored match starts at " + std::to_string(whole->first) + " instead of " +
                    std::to_string(position_);
        return std::nullopt;
    }

    MatchResult result;
    result.start = whole->first;
    result.end = whole->second;
    result.value = Slice(result.start, result.end);
    result.named_groups = pattern.NamedGroups();
    result.groups.reserve(expected_slots - 1);

    for (std::size_t i = 1; i < match.spans.size(); ++i)
    {
        if (!match.spans[i])
        {
            result.groups.emplace_back(std::nullopt);
            continue;
        }
        auto group = to_chars(*match.spans[i]);
        if (!group)
        {
            violation = "group " + std::to_string(i) + " span is out of range or not on a character boundary";
            return std::nullopt;
        }
        result.groups.emplace_back(Slice(group->first, group->second));
    }

    return result;
}

// --- Anchored ---

std::optional<std::string> Scanner::Scan(const Pattern& pattern)
{
    if (!Attempt(pattern, Anchor::AnchorStart))
        return std::nullopt;
    position_ = last_match_->end;
    return last_match_->value;
}

std::optional<std::string> Scanner::Scan(const std::string& source) { return Scan(cache_.Get(source)); }

std::optional<std::string> Scanner::Check(const Pattern& pattern)
{
    if (!Attempt(pattern, Anchor::AnchorStart))
        return std::nullopt;
    return last_match_->value;
}

std::optional<std::string> Scanner::Check(const std::string& source) { return Check(cache_.Get(source)); }

std::optional<std::size_t> Scanner::Skip(const Pattern& pattern)
{
    if (!Attempt(pattern, Anchor::AnchorStart))
        return std::nullopt;
    position_ = last_match_->end;
    return last_match_->Length();
}

std::optional<std::size_t> Scanner::Skip(const std::string& source) { return Skip(cache_.Get(source)); }

std::optional<std::size_t> Scanner::MatchLength(const Pattern& pattern)
{
    if (!Attempt(pattern, Anchor::AnchorStart))
        return std::nullopt;
    return last_match_->Length();
}

std::optional<std::size_t> Scanner::MatchLength(const std::string& source)
{
    return MatchLength(cache_.Get(source));
}

// --- Search-ahead ---

std::optional<std::string> Scanner::ScanUntil(const Pattern& pattern)
{
    const std::size_t from = position_;
    if (!Attempt(pattern, Anchor::Unanchored))
        return std::nullopt;
    position_ = last_match_->end;
    return Slice(from, position_);
}

std::optional<std::string> Scanner::ScanUntil(const std::string& source) { return ScanUntil(cache_.Get(source)); }

std::optional<std::string> Scanner::CheckUntil(const Pattern& pattern)
{
    if (!Attempt(pattern, Anchor::Unanchored))
        return std::nullopt;
    return Slice(position_, last_match_->end);
}

std::optional<std::string> Scanner::CheckUntil(const std::string& source)
{
    return CheckUntil(cache_.Get(source));
}

std::optional<std::size_t> Scanner::SkipUntil(const Pattern& pattern)
{
    const std::size_t from = position_;
    if (!Attempt(pattern, Anchor::Unanchored))
        return std::nullopt;
    position_ = last_match_->end;
    return position_ - from;
}

std::optional<std::size_t> Scanner::SkipUntil(const std::string& source) { return SkipUntil(cache_.Get(source)); }

std::optional<std::size_t> Scanner::Exist(const Pattern& pattern)
{
    if (!Attempt(pattern, Anchor::Unanchored))
        return std::nullopt;
    return last_match_->end - position_;
}

std::optional<std::size_t> Scanner::Exist(const std::string& source) { return Exist(cache_.Get(source)); }

// --- Capture transforms ---

std::optional<std::string> Scanner::ApplyTransform(const CaptureTransform& transform) const
{
    CaptureLookup lookup = [this](const std::string& name) -> Capture { return *GroupAt(name); };
    return transform(lookup);
}

std::optional<std::string> Scanner::Scan(const Pattern& pattern, const CaptureTransform& transform)
{
    if (!Scan(pattern))
        return std::nullopt;
    return ApplyTransform(transform);
}

std::optional<std::string> Scanner::Scan(const std::string& source, const CaptureTransform& transform)
{
    return Scan(cache_.Get(source), transform);
}

std::optional<std::string> Scanner::Check(const Pattern& pattern, const CaptureTransform& transform)
{
    if (!Check(pattern))
        return std::nullopt;
    return ApplyTransform(transform);
}

std::optional<std::string> Scanner::Check(const std::string& source, const CaptureTransform& transform)
{
    return Check(cache_.Get(source), transform);
}

std::optional<std::string> Scanner::ScanUntil(const Pattern& pattern, const CaptureTransform& transform)
{
    if (!ScanUntil(pattern))
        return std::nullopt;
    return ApplyTransform(transform);
}

std::optional<std::string> Scanner::ScanUntil(const std::string& source, const CaptureTransform& transform)
{
    return ScanUntil(cache_.Get(source), transform);
}

std::optional<std::string> Scanner::CheckUntil(const Pattern& pattern, const CaptureTransform& transform)
{
    if (!CheckUntil(pattern))
        return std::nullopt;
    return ApplyTransform(transform);
}

std::optional<std::string> Scanner::CheckUntil(const std::string& source, const CaptureTransform& transform)
{
    return CheckUntil(cache_.Get(source), transform);
}

// --- Match register ---

std::optional<std::string> Scanner::MatchedString() const
{
    if (!last_match_)
        return std::nullopt;
    return last_match_->value;
}

std::optional<std::size_t> Scanner::MatchedSize() const
{
    if (!last_match_)
        return std::nullopt;
    return last_match_->Length();
}

std::optional<Capture> Scanner::GroupAt(int index) const
{
    if (!last_match_)
        return std::nullopt;

    auto slot = last_match_->ResolveIndex(index);
    if (!slot)
    {
        throw UnknownGroupError("no group at index " + std::to_string(index) + " (match has " +
                                std::to_string(last_match_->groups.size()) + " groups)");
    }
    return last_match_->At(*slot);
}

std::optional<Capture> Scanner::GroupAt(const std::string& name) const
{
    if (!last_match_)
        return std::nullopt;

    auto slot = last_match_->IndexOf(name);
    if (!slot)
        throw UnknownGroupError("no group named '" + name + "'");
    return last_match_->At(*slot);
}

std::optional<std::vector<Capture>> Scanner::GroupsAt(const std::vector<int>& indices) const
{
    if (!last_match_)
        return std::nullopt;

    std::vector<Capture> result;
    result.reserve(indices.size());
    for (int index : indices)
    {
        result.push_back(*GroupAt(index));
    }
    return result;
}

std::optional<std::vector<Capture>> Scanner::NamedGroupsAt(const std::vector<std::string>& names) const
{
    if (!last_match_)
        return std::nullopt;

    std::vector<Capture> result;
    result.reserve(names.size());
    for (const auto& name : names)
    {
        result.push_back(*GroupAt(name));
    }
    return result;
}

std::optional<std::vector<Capture>> Scanner::Captures() const
{
    if (!last_match_)
        return std::nullopt;
    return last_match_->groups;
}

std::optional<std::map<std::string, Capture>> Scanner::NamedCaptures() const
{
    if (!last_match_)
        return std::nullopt;

    std::map<std::string, Capture> result;
    for (const auto& [name, index] : last_match_->named_groups)
    {
        result[name] = last_match_->At(static_cast<std::size_t>(index));
    }
    return result;
}

std::optional<std::string> Scanner::PreMatch() const
{
    if (!last_match_)
        return std::nullopt;
    return Slice(0, last_match_->start);
}

std::optional<std::string> Scanner::PostMatch() const
{
    if (!last_match_)
        return std::nullopt;
    return Slice(last_match_->end, Size());
}

std::string Scanner::Inspect() const
{
    if (AtEndOfString())
        return "#<Scanner fin>";

    std::string out = "#<Scanner " + std::to_string(position_) + "/" + std::to_string(Size());

    if (position_ > 0)
    {
        std::string before = position_ > kInspectWindow
                                 ? "..." + Slice(position_ - kInspectWindow, position_)
                                 : Slice(0, position_);
        out += " \"" + EscapeForInspect(before) + "\"";
    }

    std::string after = RemainderSize() > kInspectWindow
                            ? Slice(position_, position_ + kInspectWindow) + "..."
                            : Remainder();
    out += " @ \"" + EscapeForInspect(after) + "\">";
    return out;
}

std::string Scanner::Slice(std::size_t from, std::size_t to) const
{
    const std::size_t begin = index_.ByteOffset(from);
    return text_.substr(begin, index_.ByteOffset(to) - begin);
}

} // namespace strscan
