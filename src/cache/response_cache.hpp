/**
 * ODDSGATE - Caching Odds API Gateway
 * Response Cache - In-memory store of upstream responses keyed by CacheKey
 *
 * Features:
 * - Thread-safe with std::shared_mutex (concurrent reads, exclusive writes)
 * - Per-request TTL freshness evaluation (the TTL is not a property of the store)
 * - Optional entry bound with least-recently-written eviction
 * - Injectable clock for deterministic tests
 * - Cache statistics for monitoring
 */

#ifndef ODDSGATE_CACHE_RESPONSE_CACHE_HPP
#define ODDSGATE_CACHE_RESPONSE_CACHE_HPP

#include "cache/cache_key.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <list>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace oddsgate::cache {

/**
 * Cached upstream response. Never mutated after it is written.
 */
struct CacheEntry {
    std::chrono::steady_clock::time_point timestamp;  // When entry was written
    int status_code{0};                               // Upstream HTTP status
    std::string body;                                 // Transformed (2xx) or raw body
};

/**
 * Cache statistics for monitoring
 */
struct CacheStats {
    std::uint64_t hits{0};          // Fresh entries served
    std::uint64_t misses{0};        // Lookups with no entry
    std::uint64_t stale{0};         // Lookups that found an expired entry
    std::uint64_t writes{0};        // Total puts
    std::uint64_t evictions{0};     // Entries dropped by the entry bound

    std::size_t entries{0};         // Current number of entries
    std::size_t size_bytes{0};      // Sum of cached body sizes
    std::size_t max_entries{0};     // 0 = unbounded

    double hit_rate() const {
        auto total = hits + misses + stale;
        return total > 0 ? static_cast<double>(hits) / total : 0.0;
    }
};

/**
 * Response cache configuration
 */
struct ResponseCacheConfig {
    std::size_t max_entries{0};  // 0 keeps every key for the process lifetime
};

/**
 * Thread-safe response cache
 *
 * Entries are only ever replaced as a whole by put(). Two requests racing on
 * the same cold key may both fetch upstream; the later put() wins.
 */
class ResponseCache {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    /**
     * @param config Store configuration
     * @param clock Time source; defaults to std::chrono::steady_clock::now
     */
    explicit ResponseCache(const ResponseCacheConfig& config = {}, Clock clock = {});
    ~ResponseCache() = default;

    // Non-copyable, non-movable
    ResponseCache(const ResponseCache&) = delete;
    ResponseCache& operator=(const ResponseCache&) = delete;
    ResponseCache(ResponseCache&&) = delete;
    ResponseCache& operator=(ResponseCache&&) = delete;

    /**
     * Get the stored entry for a key, fresh or not
     */
    std::optional<CacheEntry> get(const CacheKey& key) const;

    /**
     * Store an entry, replacing any previous one for the key
     */
    void put(const CacheKey& key, CacheEntry entry);

    /**
     * True iff (now - entry.timestamp) < ttl
     */
    bool is_fresh(const CacheEntry& entry, std::chrono::seconds ttl) const;

    /**
     * Get the entry for a key only if it is fresh under the given TTL.
     * Updates hit/miss/stale statistics.
     */
    std::optional<CacheEntry> lookup(const CacheKey& key, std::chrono::seconds ttl);

    /**
     * Build an entry stamped with the current time
     */
    CacheEntry make_entry(int status_code, std::string body) const;

    /**
     * Current time according to the store's clock
     */
    std::chrono::steady_clock::time_point now() const;

    /**
     * Remove all entries
     */
    void clear();

    /**
     * Get cache statistics (thread-safe)
     */
    CacheStats get_stats() const;

private:
    struct Node {
        CacheKey key;
        CacheEntry entry;
    };

    using EntryList = std::list<Node>;
    using EntryMap = std::unordered_map<CacheKey, typename EntryList::iterator, CacheKeyHash>;

    /**
     * Drop least-recently-written entries while over the bound
     * Must be called with exclusive lock held
     */
    void evict_if_needed();

    mutable std::shared_mutex mutex_;
    ResponseCacheConfig config_;
    Clock clock_;

    EntryList entries_;  // Front = most recently written
    EntryMap index_;

    std::atomic<std::uint64_t> hits_{0};
    std::atomic<std::uint64_t> misses_{0};
    std::atomic<std::uint64_t> stale_{0};
    std::atomic<std::uint64_t> writes_{0};
    std::atomic<std::uint64_t> evictions_{0};
    std::atomic<std::size_t> size_bytes_{0};
};

} // namespace oddsgate::cache

#endif // ODDSGATE_CACHE_RESPONSE_CACHE_HPP
