#pragma once

#include <cstddef>
#include <list>
#include <optional>
#include <unordered_map>
#include <utility>

namespace utils
{

// Count-bounded LRU cache. A capacity of 0 means unbounded.
// Not thread-safe.
template <typename K, typename V>
class LRUCache {
public:
    explicit LRUCache(std::size_t capacity = 64) : capacity_(capacity) {}

    void setCapacity(std::size_t cap) { capacity_ = cap; trim(); }
    std::size_t capacity() const { return capacity_; }
    std::size_t size() const { return items_.size(); }

    std::optional<V> get(const K& key) {
        auto it = map_.find(key);
        if (it == map_.end()) return std::nullopt;
        items_.splice(items_.begin(), items_, it->second);
        return it->second->second;
    }

    bool contains(const K& key) const { return map_.find(key) != map_.end(); }

    void put(const K& key, V val) {
        auto it = map_.find(key);
        if (it != map_.end()) {
            it->second->second = std::move(val);
            items_.splice(items_.begin(), items_, it->second);
            return;
        }
        items_.emplace_front(key, std::move(val));
        map_[items_.front().first] = items_.begin();
        trim();
    }

    void clear() {
        items_.clear();
        map_.clear();
    }

private:
    void trim() {
        while (capacity_ > 0 && items_.size() > capacity_) {
            auto last = items_.end();
            --last;
            map_.erase(last->first);
            items_.pop_back();
        }
    }

    std::size_t capacity_;
    std::list<std::pair<K, V>> items_;
    std::unordered_map<K, typename std::list<std::pair<K, V>>::iterator> map_;
};

} // namespace utils
