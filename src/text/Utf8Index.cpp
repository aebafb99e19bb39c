#include "Utf8Index.hpp"

#include <algorithm>
#include <utf8proc.h>

namespace text
{

Utf8Index::Utf8Index()
    : starts_{ 0 }
{
}

std::optional<Utf8Index> Utf8Index::Build(std::string_view utf8)
{
    Utf8Index index;
    if (!index.Append(utf8))
        return std::nullopt;
    return index;
}

bool Utf8Index::Append(std::string_view utf8)
{
    if (utf8.empty())
        return true;

    const std::size_t base = ByteSize();
    std::vector<std::size_t> added;
    added.reserve(utf8.size());

    const utf8proc_uint8_t* str = reinterpret_cast<const utf8proc_uint8_t*>(utf8.data());
    utf8proc_ssize_t len = static_cast<utf8proc_ssize_t>(utf8.size());

    utf8proc_ssize_t pos = 0;
    while (pos < len)
    {
        utf8proc_int32_t codepoint;
        utf8proc_ssize_t bytes = utf8proc_iterate(str + pos, len - pos, &codepoint);
        if (bytes <= 0 || codepoint < 0)
            return false;
        pos += bytes;
        added.push_back(base + static_cast<std::size_t>(pos));
    }

    // The previous end sentinel becomes the start of the first appended character.
    starts_.insert(starts_.end(), added.begin(), added.end());
    return true;
}

std::optional<std::size_t> Utf8Index::CharOffset(std::size_t byte_offset) const
{
    auto it = std::lower_bound(starts_.begin(), starts_.end(), byte_offset);
    if (it == starts_.end() || *it != byte_offset)
        return std::nullopt;
    return static_cast<std::size_t>(it - starts_.begin());
}

} // namespace text
