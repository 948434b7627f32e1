#include <gtest/gtest.h>
#include "cache/TtlCache.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <barrier>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace ms::cache;
using namespace std::chrono_literals;

namespace {

using IntCache = TtlCache<std::string, int>;

// Hand-cranked clock shared between the test and the cache.
struct ManualClock {
    std::shared_ptr<std::atomic<IntCache::Clock::rep>> ticks = std::make_shared<std::atomic<IntCache::Clock::rep>>(0);

    [[nodiscard]] IntCache::TimeSource source() const {
        return [t = ticks] { return IntCache::Clock::time_point(IntCache::Clock::duration(t->load())); };
    }

    void advance(const std::chrono::nanoseconds d) const {
        ticks->fetch_add(std::chrono::duration_cast<IntCache::Clock::duration>(d).count());
    }
};

}

class TtlCacheTest : public ::testing::Test {
protected:
    ManualClock clock;
    IntCache cache{5min, clock.source()};
    std::atomic<int> computations{0};

    int lookup(const std::string& key, const int value = 42) {
        return cache.getOrCompute(key, [&] {
            ++computations;
            return value;
        });
    }
};

TEST_F(TtlCacheTest, ServesFreshEntriesWithoutRecomputing) {
    EXPECT_EQ(lookup("file-1", 1), 1);
    clock.advance(4min + 59s);
    EXPECT_EQ(lookup("file-1", 2), 1);
    EXPECT_EQ(computations.load(), 1);

    const auto s = cache.stats();
    EXPECT_EQ(s.misses, 1u);
    EXPECT_EQ(s.hits, 1u);
}

TEST_F(TtlCacheTest, SnapshotReportsRatesAndExtractionWork) {
    EXPECT_DOUBLE_EQ(CacheStats::hit_rate(cache.stats()), 0.0);
    EXPECT_DOUBLE_EQ(CacheStats::avg_op_ms(cache.stats()), 0.0);

    lookup("file-1");
    lookup("file-1");
    lookup("file-1");
    lookup("file-2");

    const auto s = cache.stats();
    EXPECT_DOUBLE_EQ(CacheStats::hit_rate(s), 0.5);
    EXPECT_EQ(s.op_count, 2u);
    EXPECT_GE(s.op_max_us * 2, s.op_total_us);

    const nlohmann::json j = s;
    EXPECT_EQ(j.at("hits").get<uint64_t>(), 2u);
    EXPECT_EQ(j.at("misses").get<uint64_t>(), 2u);
    EXPECT_EQ(j.at("entries").get<uint64_t>(), 2u);
    EXPECT_DOUBLE_EQ(j.at("hit_rate").get<double>(), 0.5);
    EXPECT_EQ(j.at("op").at("count").get<uint64_t>(), 2u);
    EXPECT_TRUE(j.at("op").contains("avg_ms"));
}

TEST_F(TtlCacheTest, RecomputesAfterExpiry) {
    EXPECT_EQ(lookup("file-1", 1), 1);
    clock.advance(5min + 1s);
    EXPECT_EQ(lookup("file-1", 2), 2);
    EXPECT_EQ(computations.load(), 2);
    EXPECT_EQ(cache.stats().evictions, 1u);
}

TEST_F(TtlCacheTest, KeysAreIndependent) {
    lookup("a", 1);
    lookup("b", 2);
    EXPECT_EQ(cache.size(), 2u);
    EXPECT_EQ(cache.peek("a"), 1);
    EXPECT_EQ(cache.peek("b"), 2);
    EXPECT_FALSE(cache.peek("c"));
}

TEST_F(TtlCacheTest, ExceptionsAreNotCached) {
    EXPECT_THROW(cache.getOrCompute("bad", []() -> int { throw std::runtime_error("boom"); }), std::runtime_error);
    EXPECT_EQ(cache.size(), 0u);
    EXPECT_EQ(cache.stats().failures, 1u);

    EXPECT_EQ(lookup("bad", 7), 7);
    EXPECT_EQ(cache.size(), 1u);
}

TEST_F(TtlCacheTest, PurgeAndInvalidate) {
    lookup("a");
    clock.advance(3min);
    lookup("b");
    clock.advance(3min);

    EXPECT_EQ(cache.purgeExpired(), 1u);
    EXPECT_FALSE(cache.peek("a"));
    EXPECT_TRUE(cache.peek("b"));

    cache.invalidate("b");
    EXPECT_EQ(cache.size(), 0u);

    lookup("c");
    cache.clear();
    EXPECT_EQ(cache.size(), 0u);
}

TEST(TtlCacheConcurrencyTest, ConcurrentMissesComputeOnce) {
    IntCache cache{5min};
    std::atomic<int> computations{0};
    constexpr int callers = 16;

    std::barrier start(callers);
    std::vector<std::thread> threads;
    std::vector<int> results(callers, 0);

    for (int i = 0; i < callers; ++i) {
        threads.emplace_back([&, i] {
            start.arrive_and_wait();
            results[i] = cache.getOrCompute("same-file", [&] {
                ++computations;
                std::this_thread::sleep_for(200ms);
                return 99;
            });
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(computations.load(), 1);
    for (const auto r : results) EXPECT_EQ(r, 99);

    const auto s = cache.stats();
    EXPECT_EQ(s.misses, 1u);
    EXPECT_EQ(s.hits + s.coalesced, static_cast<uint64_t>(callers - 1));
}

TEST(TtlCacheConcurrencyTest, WaitersSeeTheSameException) {
    IntCache cache{5min};
    std::atomic<int> computations{0}, failures{0};
    constexpr int callers = 8;

    std::barrier start(callers);
    std::vector<std::thread> threads;
    for (int i = 0; i < callers; ++i) {
        threads.emplace_back([&] {
            start.arrive_and_wait();
            try {
                cache.getOrCompute("broken", [&]() -> int {
                    ++computations;
                    std::this_thread::sleep_for(200ms);
                    throw std::runtime_error("probe exploded");
                });
            } catch (const std::runtime_error&) {
                ++failures;
            }
        });
    }
    for (auto& t : threads) t.join();

    // Late arrivals after the failure may start a fresh computation, never a cached value
    EXPECT_GE(computations.load(), 1);
    EXPECT_EQ(failures.load(), callers);
    EXPECT_EQ(cache.size(), 0u);
}
