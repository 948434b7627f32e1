#pragma once

#include "cache/CacheStats.hpp"
#include "types/MediaInfo.hpp"

#include <chrono>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace ms::cache {

// Time-bounded memo with single-flight misses. Concurrent callers for a key that is
// being computed wait on the same shared_future instead of computing again.
template <typename Key, typename Value, typename Hash = std::hash<Key>>
class TtlCache {
public:
    using Clock = std::chrono::steady_clock;
    using TimeSource = std::function<Clock::time_point()>;

    explicit TtlCache(const Clock::duration ttl, TimeSource now = &Clock::now)
        : ttl_(ttl), now_(std::move(now)), stats_(std::make_shared<CacheStats>()) {}

    TtlCache(const TtlCache&) = delete;
    TtlCache& operator=(const TtlCache&) = delete;

    // Returns the cached value if it is younger than the TTL, otherwise runs compute
    // once on this thread and shares its outcome with every caller waiting on the key.
    // An exception from compute reaches all of them and leaves nothing cached.
    Value getOrCompute(const Key& key, const std::function<Value()>& compute) {
        {
            std::shared_lock lock(mutex_);
            if (const auto it = entries_.find(key); it != entries_.end() && fresh(it->second)) {
                stats_->record_hit();
                return it->second.value;
            }
        }

        std::promise<Value> promise;
        {
            std::unique_lock lock(mutex_);
            if (const auto it = entries_.find(key); it != entries_.end()) {
                if (fresh(it->second)) {
                    stats_->record_hit();
                    return it->second.value;
                }
                entries_.erase(it);
                stats_->record_eviction();
                stats_->set_entries(entries_.size());
            }

            if (const auto it = inflight_.find(key); it != inflight_.end()) {
                auto pending = it->second;
                lock.unlock();
                stats_->record_coalesced();
                return pending.get();
            }

            inflight_.emplace(key, promise.get_future().share());
            stats_->record_miss();
        }

        const auto started = Clock::now();
        try {
            Value value = compute();
            stats_->record_op_us(elapsedUs(started));
            {
                std::unique_lock lock(mutex_);
                entries_.insert_or_assign(key, Entry{value, now_()});
                inflight_.erase(key);
                stats_->record_insert();
                stats_->set_entries(entries_.size());
            }
            promise.set_value(value);
            return value;
        } catch (...) {
            {
                std::unique_lock lock(mutex_);
                inflight_.erase(key);
            }
            stats_->record_failure();
            promise.set_exception(std::current_exception());
            throw;
        }
    }

    [[nodiscard]] std::optional<Value> peek(const Key& key) const {
        std::shared_lock lock(mutex_);
        const auto it = entries_.find(key);
        if (it == entries_.end() || !fresh(it->second)) return std::nullopt;
        return it->second.value;
    }

    void invalidate(const Key& key) {
        std::unique_lock lock(mutex_);
        if (entries_.erase(key)) {
            stats_->record_eviction();
            stats_->set_entries(entries_.size());
        }
    }

    // Drops every expired entry, returns how many went.
    size_t purgeExpired() {
        std::unique_lock lock(mutex_);
        size_t removed = 0;
        for (auto it = entries_.begin(); it != entries_.end();) {
            if (fresh(it->second)) ++it;
            else {
                it = entries_.erase(it);
                ++removed;
            }
        }
        if (removed) stats_->record_eviction(removed);
        stats_->set_entries(entries_.size());
        return removed;
    }

    void clear() {
        std::unique_lock lock(mutex_);
        entries_.clear();
        stats_->set_entries(0);
    }

    [[nodiscard]] size_t size() const {
        std::shared_lock lock(mutex_);
        return entries_.size();
    }

    [[nodiscard]] Clock::duration ttl() const { return ttl_; }
    [[nodiscard]] CacheStatsSnapshot stats() const { return stats_->snapshot(); }

private:
    struct Entry {
        Value value;
        Clock::time_point inserted_at;
    };

    const Clock::duration ttl_;
    TimeSource now_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<Key, Entry, Hash> entries_;
    std::unordered_map<Key, std::shared_future<Value>, Hash> inflight_;
    std::shared_ptr<CacheStats> stats_;

    [[nodiscard]] bool fresh(const Entry& e) const { return now_() - e.inserted_at <= ttl_; }

    static uint64_t elapsedUs(const Clock::time_point since) {
        return static_cast<uint64_t>(
            std::chrono::duration_cast<std::chrono::microseconds>(Clock::now() - since).count());
    }
};

using ResultCache = TtlCache<std::string, types::MediaInfo>;

}
