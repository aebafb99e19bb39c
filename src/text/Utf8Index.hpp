#pragma once

#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

namespace text
{

/// Character (code point) to byte offset table for a UTF-8 buffer.
/// Offsets are stored for every character start plus one trailing entry for the
/// total byte size, so CharCount() + 1 entries are always present.
class Utf8Index
{
public:
    Utf8Index();

    /// Builds the table, or nullopt if the input is not valid UTF-8.
    static std::optional<Utf8Index> Build(std::string_view utf8);

    /// Extends the table with more text. On invalid UTF-8 the table is left untouched
    /// and false is returned.
    [[nodiscard]] bool Append(std::string_view utf8);

    std::size_t CharCount() const { return starts_.size() - 1; }
    std::size_t ByteSize() const { return starts_.back(); }

    // char_offset must be <= CharCount()
    std::size_t ByteOffset(std::size_t char_offset) const { return starts_[char_offset]; }

    /// nullopt when byte_offset is past the end or splits a multi-byte sequence.
    std::optional<std::size_t> CharOffset(std::size_t byte_offset) const;

private:
    std::vector<std::size_t> starts_;
};

} // namespace text
