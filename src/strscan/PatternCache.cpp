#include "PatternCache.hpp"

#include <plog/Log.h>

namespace strscan
{

PatternCache::PatternCache(PatternOptions options, std::size_t capacity)
    : options_(options)
    , cache_(capacity)
{
}

Pattern PatternCache::Get(const std::string& source)
{
    if (auto cached = cache_.get(source))
    {
        ++hits_;
        return *cached;
    }

    ++misses_;
    Pattern pattern = Pattern::FromString(source, options_);
    PLOG_DEBUG << "Compiled pattern '" << source << "' (" << pattern.GroupCount() << " groups)";
    cache_.put(source, pattern);
    return pattern;
}

} // namespace strscan
