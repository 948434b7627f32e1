#pragma once

#include <atomic>
#include <cstdint>
#include <memory>

#include <nlohmann/json_fwd.hpp>

namespace ms::cache {

// 64-byte cache line padding helper to avoid false sharing.
constexpr std::size_t kCacheLine = 64;

template <typename T>
struct alignas(kCacheLine) PaddedAtomic {
    std::atomic<T> v{0};
    char pad[kCacheLine - (sizeof(std::atomic<T>) % kCacheLine ? (sizeof(std::atomic<T>) % kCacheLine) : kCacheLine)]{};
};

struct LatencyStats {
    PaddedAtomic<uint64_t> count;
    PaddedAtomic<uint64_t> total_us;
    PaddedAtomic<uint64_t> max_us;

    void observe_us(uint64_t us) noexcept;
};

struct CacheStatsSnapshot {
    uint64_t hits{};
    uint64_t misses{};
    uint64_t coalesced{};   // callers that joined an in-flight computation

    uint64_t inserts{};
    uint64_t evictions{};
    uint64_t failures{};    // computations that threw, nothing cached

    uint64_t entries{};

    // Work behind misses (a full extraction)
    uint64_t op_count{};
    uint64_t op_total_us{};
    uint64_t op_max_us{};
};

struct CacheStats {
    PaddedAtomic<uint64_t> hits;
    PaddedAtomic<uint64_t> misses;
    PaddedAtomic<uint64_t> coalesced;

    PaddedAtomic<uint64_t> inserts;
    PaddedAtomic<uint64_t> evictions;
    PaddedAtomic<uint64_t> failures;

    PaddedAtomic<uint64_t> entries;

    LatencyStats op_latency;

    void record_hit() noexcept;
    void record_miss() noexcept;
    void record_coalesced() noexcept;
    void record_insert() noexcept;
    void record_eviction(uint64_t n = 1) noexcept;
    void record_failure() noexcept;
    void set_entries(uint64_t n) noexcept;
    void record_op_us(uint64_t us) noexcept;

    [[nodiscard]] CacheStatsSnapshot snapshot() const noexcept;

    static double hit_rate(const CacheStatsSnapshot& s) noexcept;
    static double avg_op_ms(const CacheStatsSnapshot& s) noexcept;
};

void to_json(nlohmann::json& j, const CacheStatsSnapshot& s);

}
