#pragma once

#include "Pattern.hpp"
#include "../utils/LRUCache.hpp"

#include <cstddef>
#include <string>

namespace strscan
{

/**
 * @brief Compiles pattern sources on demand and keeps the most recent ones
 *
 * All entries share one set of PatternOptions, so the source string alone is the key.
 * Not thread-safe; each Scanner owns its own cache.
 */
class PatternCache
{
public:
    static constexpr std::size_t kDefaultCapacity = 64;

    explicit PatternCache(PatternOptions options = {}, std::size_t capacity = kDefaultCapacity);

    /// @throws InvalidPatternError when the source does not compile (nothing is cached)
    Pattern Get(const std::string& source);

    void SetCapacity(std::size_t capacity) { cache_.setCapacity(capacity); }
    std::size_t Capacity() const { return cache_.capacity(); }
    std::size_t Size() const { return cache_.size(); }
    void Clear() { cache_.clear(); }

    const PatternOptions& Options() const { return options_; }

    std::size_t Hits() const { return hits_; }
    std::size_t Misses() const { return misses_; }

private:
    PatternOptions options_;
    utils::LRUCache<std::string, Pattern> cache_;
    std::size_t hits_ = 0;
    std::size_t misses_ = 0;
};

} // namespace strscan
