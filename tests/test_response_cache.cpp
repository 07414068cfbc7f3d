#include "cache/response_cache.hpp"

#include <catch2/catch.hpp>

#include <memory>
#include <thread>
#include <vector>

using namespace oddsgate::cache;
using namespace std::chrono_literals;

namespace {

// Clock that only moves when told to
struct ManualClock {
    std::shared_ptr<std::chrono::steady_clock::time_point> now =
        std::make_shared<std::chrono::steady_clock::time_point>(std::chrono::steady_clock::time_point{} + 1000s);

    ResponseCache::Clock fn() const {
        auto state = now;
        return [state] { return *state; };
    }

    void advance(std::chrono::steady_clock::duration d) { *now += d; }
};

CacheKey key_for(const std::string& sport) {
    return derive_cache_key("odds", {{"sport", sport}});
}

} // namespace

TEST_CASE("Entry is fresh strictly before the TTL elapses", "[cache][ttl]") {
    ManualClock clock;
    ResponseCache cache({}, clock.fn());
    auto key = key_for("nfl");

    cache.put(key, cache.make_entry(200, "[]"));

    clock.advance(59s);
    auto hit = cache.lookup(key, 60s);
    REQUIRE(hit.has_value());
    CHECK(hit->status_code == 200);
    CHECK(hit->body == "[]");

    clock.advance(1s);
    CHECK_FALSE(cache.lookup(key, 60s).has_value());

    // Entry is still stored, only stale
    CHECK(cache.get(key).has_value());
}

TEST_CASE("Freshness is judged with the caller's TTL", "[cache][ttl]") {
    ManualClock clock;
    ResponseCache cache({}, clock.fn());
    auto key = key_for("nfl");

    cache.put(key, cache.make_entry(200, "[]"));
    clock.advance(30s);

    CHECK_FALSE(cache.lookup(key, 10s).has_value());
    CHECK(cache.lookup(key, 120s).has_value());
}

TEST_CASE("put overwrites the whole entry", "[cache]") {
    ManualClock clock;
    ResponseCache cache({}, clock.fn());
    auto key = key_for("nfl");

    cache.put(key, cache.make_entry(404, R"({"message":"not found"})"));
    clock.advance(100s);
    cache.put(key, cache.make_entry(200, "[1]"));

    auto entry = cache.get(key);
    REQUIRE(entry.has_value());
    CHECK(entry->status_code == 200);
    CHECK(entry->body == "[1]");
    CHECK(entry->timestamp == clock.fn()());
    CHECK(cache.get_stats().entries == 1);
}

TEST_CASE("Statistics track hits, misses and stale lookups", "[cache][stats]") {
    ManualClock clock;
    ResponseCache cache({}, clock.fn());
    auto key = key_for("nfl");

    CHECK_FALSE(cache.lookup(key, 60s).has_value());
    cache.put(key, cache.make_entry(200, "abcd"));
    CHECK(cache.lookup(key, 60s).has_value());
    clock.advance(61s);
    CHECK_FALSE(cache.lookup(key, 60s).has_value());

    auto stats = cache.get_stats();
    CHECK(stats.misses == 1);
    CHECK(stats.hits == 1);
    CHECK(stats.stale == 1);
    CHECK(stats.writes == 1);
    CHECK(stats.entries == 1);
    CHECK(stats.size_bytes == 4);
    CHECK(stats.max_entries == 0);
    CHECK(stats.hit_rate() == Approx(1.0 / 3.0));
}

TEST_CASE("Unbounded cache keeps every key", "[cache][eviction]") {
    ResponseCache cache;
    for (int i = 0; i < 100; ++i) {
        cache.put(key_for("sport" + std::to_string(i)), cache.make_entry(200, "[]"));
    }
    auto stats = cache.get_stats();
    CHECK(stats.entries == 100);
    CHECK(stats.evictions == 0);
}

TEST_CASE("Bounded cache evicts the least recently written key", "[cache][eviction]") {
    ResponseCache cache(ResponseCacheConfig{.max_entries = 2});

    cache.put(key_for("a"), cache.make_entry(200, "a"));
    cache.put(key_for("b"), cache.make_entry(200, "b"));
    // Rewriting "a" makes "b" the oldest
    cache.put(key_for("a"), cache.make_entry(200, "a2"));
    cache.put(key_for("c"), cache.make_entry(200, "c"));

    CHECK(cache.get(key_for("a")).has_value());
    CHECK_FALSE(cache.get(key_for("b")).has_value());
    CHECK(cache.get(key_for("c")).has_value());

    auto stats = cache.get_stats();
    CHECK(stats.entries == 2);
    CHECK(stats.evictions == 1);
    CHECK(stats.size_bytes == 3);
}

TEST_CASE("clear removes all entries", "[cache]") {
    ResponseCache cache;
    cache.put(key_for("a"), cache.make_entry(200, "a"));
    cache.put(key_for("b"), cache.make_entry(200, "b"));

    cache.clear();

    CHECK_FALSE(cache.get(key_for("a")).has_value());
    CHECK(cache.get_stats().entries == 0);
    CHECK(cache.get_stats().size_bytes == 0);
}

TEST_CASE("Concurrent writers and readers leave a consistent store", "[cache][concurrency]") {
    ResponseCache cache;
    std::vector<std::thread> threads;

    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&cache, t] {
            for (int i = 0; i < 200; ++i) {
                auto key = key_for("sport" + std::to_string(i % 10));
                cache.put(key, cache.make_entry(200, std::to_string(t)));
                cache.lookup(key, 60s);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    auto stats = cache.get_stats();
    CHECK(stats.entries == 10);
    CHECK(stats.writes == 800);
    CHECK(stats.size_bytes == 10);
}
