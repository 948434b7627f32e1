#include "cache/CacheStats.hpp"

#include <nlohmann/json.hpp>

using namespace ms::cache;

void LatencyStats::observe_us(const uint64_t us) noexcept {
    count.v.fetch_add(1, std::memory_order_relaxed);
    total_us.v.fetch_add(us, std::memory_order_relaxed);

    uint64_t cur = max_us.v.load(std::memory_order_relaxed);
    while (us > cur && !max_us.v.compare_exchange_weak(cur, us, std::memory_order_relaxed)) {
        // cur updated by compare_exchange_weak
    }
}

void CacheStats::record_hit() noexcept { hits.v.fetch_add(1, std::memory_order_relaxed); }

void CacheStats::record_miss() noexcept { misses.v.fetch_add(1, std::memory_order_relaxed); }

void CacheStats::record_coalesced() noexcept { coalesced.v.fetch_add(1, std::memory_order_relaxed); }

void CacheStats::record_insert() noexcept { inserts.v.fetch_add(1, std::memory_order_relaxed); }

void CacheStats::record_eviction(const uint64_t n) noexcept {
    evictions.v.fetch_add(n, std::memory_order_relaxed);
}

void CacheStats::record_failure() noexcept { failures.v.fetch_add(1, std::memory_order_relaxed); }

void CacheStats::set_entries(const uint64_t n) noexcept { entries.v.store(n, std::memory_order_relaxed); }

void CacheStats::record_op_us(const uint64_t us) noexcept { op_latency.observe_us(us); }

CacheStatsSnapshot CacheStats::snapshot() const noexcept {
    CacheStatsSnapshot s;
    s.hits = hits.v.load(std::memory_order_relaxed);
    s.misses = misses.v.load(std::memory_order_relaxed);
    s.coalesced = coalesced.v.load(std::memory_order_relaxed);

    s.inserts = inserts.v.load(std::memory_order_relaxed);
    s.evictions = evictions.v.load(std::memory_order_relaxed);
    s.failures = failures.v.load(std::memory_order_relaxed);

    s.entries = entries.v.load(std::memory_order_relaxed);

    s.op_count = op_latency.count.v.load(std::memory_order_relaxed);
    s.op_total_us = op_latency.total_us.v.load(std::memory_order_relaxed);
    s.op_max_us = op_latency.max_us.v.load(std::memory_order_relaxed);
    return s;
}

double CacheStats::hit_rate(const CacheStatsSnapshot& s) noexcept {
    const auto denom = s.hits + s.misses;
    return denom ? static_cast<double>(s.hits) / static_cast<double>(denom) : 0.0;
}

double CacheStats::avg_op_ms(const CacheStatsSnapshot& s) noexcept {
    return s.op_count ? (static_cast<double>(s.op_total_us) / 1000.0) / static_cast<double>(s.op_count) : 0.0;
}

void ms::cache::to_json(nlohmann::json& j, const CacheStatsSnapshot& s) {
    j = nlohmann::json{
        {"hits", s.hits},
        {"misses", s.misses},
        {"coalesced", s.coalesced},
        {"inserts", s.inserts},
        {"evictions", s.evictions},
        {"failures", s.failures},
        {"entries", s.entries},
        {"hit_rate", CacheStats::hit_rate(s)},
        {"op", {
            {"count", s.op_count},
            {"total_us", s.op_total_us},
            {"max_us", s.op_max_us},
            {"avg_ms", CacheStats::avg_op_ms(s)},
        }},
    };
}
