#pragma once

#include "dynasty/core/clock.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <utility>

namespace dynasty::e2ee {

/**
 * @brief Ordered cache with a hard capacity and a per-entry lifetime.
 *
 * Entries carry the time they were last stored or touched. Inserting past
 * capacity evicts the oldest entries first. Expired entries are dropped by
 * Tick() or lazily on lookup. Not synchronized: owners hold their own lock.
 *
 * Copying a cache copies every value, so a copy can serve as a scratch state
 * that is committed or discarded as a whole.
 */
template<typename K, typename V>
class BoundedTtlCache {
public:
    BoundedTtlCache(const size_t capacity, const Clock::duration ttl)
        : capacity_(capacity)
        , ttl_(ttl) {}

    /// Inserts or replaces. Returns the number of entries evicted for capacity.
    size_t Put(const K& key, V value, const TimePoint stamp) {
        Erase(key);
        const uint64_t seq = next_seq_++;
        entries_.insert_or_assign(key, Entry{std::move(value), stamp, seq});
        order_.emplace(seq, key);

        size_t evicted = 0;
        while (entries_.size() > capacity_ && !order_.empty()) {
            const auto oldest = order_.begin();
            entries_.erase(oldest->second);
            order_.erase(oldest);
            ++evicted;
        }
        return evicted;
    }

    [[nodiscard]] V* Find(const K& key, const TimePoint now) {
        const auto it = entries_.find(key);
        if (it == entries_.end()) {
            return nullptr;
        }
        if (IsExpired(it->second, now)) {
            order_.erase(it->second.seq);
            entries_.erase(it);
            return nullptr;
        }
        return &it->second.value;
    }

    [[nodiscard]] bool Contains(const K& key, const TimePoint now) {
        return Find(key, now) != nullptr;
    }

    /// Removes and returns a live entry.
    [[nodiscard]] std::optional<V> Take(const K& key, const TimePoint now) {
        const auto it = entries_.find(key);
        if (it == entries_.end()) {
            return std::nullopt;
        }
        const bool expired = IsExpired(it->second, now);
        std::optional<V> taken;
        if (!expired) {
            taken.emplace(std::move(it->second.value));
        }
        order_.erase(it->second.seq);
        entries_.erase(it);
        return taken;
    }

    /// Refreshes the entry's timestamp and moves it to the young end.
    bool Touch(const K& key, const TimePoint now) {
        const auto it = entries_.find(key);
        if (it == entries_.end() || IsExpired(it->second, now)) {
            return false;
        }
        order_.erase(it->second.seq);
        it->second.seq = next_seq_++;
        it->second.stamp = now;
        order_.emplace(it->second.seq, key);
        return true;
    }

    bool Erase(const K& key) {
        const auto it = entries_.find(key);
        if (it == entries_.end()) {
            return false;
        }
        order_.erase(it->second.seq);
        entries_.erase(it);
        return true;
    }

    /// Drops every expired entry. Returns the number removed.
    size_t Tick(const TimePoint now) {
        size_t removed = 0;
        for (auto it = entries_.begin(); it != entries_.end();) {
            if (IsExpired(it->second, now)) {
                order_.erase(it->second.seq);
                it = entries_.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
        return removed;
    }

    void Clear() {
        entries_.clear();
        order_.clear();
    }

    /// Visits entries oldest first.
    template<typename F>
    void ForEach(F&& visit) const {
        for (const auto& [seq, key] : order_) {
            const auto& entry = entries_.at(key);
            visit(key, entry.value, entry.stamp);
        }
    }

    [[nodiscard]] size_t Size() const noexcept { return entries_.size(); }
    [[nodiscard]] bool Empty() const noexcept { return entries_.empty(); }
    [[nodiscard]] size_t Capacity() const noexcept { return capacity_; }
    [[nodiscard]] Clock::duration Ttl() const noexcept { return ttl_; }

private:
    struct Entry {
        V value;
        TimePoint stamp;
        uint64_t seq;
    };

    [[nodiscard]] bool IsExpired(const Entry& entry, const TimePoint now) const {
        return now - entry.stamp > ttl_;
    }

    size_t capacity_;
    Clock::duration ttl_;
    uint64_t next_seq_ = 0;
    std::map<K, Entry> entries_;
    std::map<uint64_t, K> order_;
};

}
