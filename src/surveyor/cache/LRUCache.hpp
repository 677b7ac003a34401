#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <list>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <utility>

namespace surveyor {

/**
 * @brief Count-bounded, internally locked LRU map
 *
 * Holds the content-key -> node index of the AssetCache. Eviction only costs
 * a store round trip on the next lookup; it never affects correctness.
 */
template <typename K, typename V>
class LRUCache
{
public:
    explicit LRUCache(std::size_t capacity = 100000)
        : capacity_(capacity)
    {
    }

    LRUCache(const LRUCache&) = delete;
    LRUCache& operator=(const LRUCache&) = delete;

    std::optional<V> Get(const K& key)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = map_.find(key);
        if (it == map_.end())
        {
            misses_.fetch_add(1, std::memory_order_relaxed);
            return std::nullopt;
        }
        items_.splice(items_.begin(), items_, it->second);
        hits_.fetch_add(1, std::memory_order_relaxed);
        return it->second->second;
    }

    void Put(const K& key, const V& val)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = map_.find(key);
        if (it != map_.end())
        {
            it->second->second = val;
            items_.splice(items_.begin(), items_, it->second);
            return;
        }
        items_.emplace_front(key, val);
        map_[items_.front().first] = items_.begin();
        TrimLocked();
    }

    bool Erase(const K& key)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = map_.find(key);
        if (it == map_.end())
            return false;
        items_.erase(it->second);
        map_.erase(it);
        return true;
    }

    void Clear()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        items_.clear();
        map_.clear();
    }

    std::size_t Size() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    std::uint64_t Hits() const { return hits_.load(std::memory_order_relaxed); }
    std::uint64_t Misses() const { return misses_.load(std::memory_order_relaxed); }

private:
    void TrimLocked()
    {
        while (capacity_ > 0 && items_.size() > capacity_)
        {
            map_.erase(items_.back().first);
            items_.pop_back();
        }
    }

    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::list<std::pair<K, V>> items_;
    std::unordered_map<K, typename std::list<std::pair<K, V>>::iterator> map_;
    std::atomic<std::uint64_t> hits_{ 0 };
    std::atomic<std::uint64_t> misses_{ 0 };
};

} // namespace surveyor
