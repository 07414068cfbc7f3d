/**
 * ODDSGATE - Caching Odds API Gateway
 * Cache Key - canonical, credential-free keys for upstream responses
 *
 * A key is built from:
 * - The logical resource path ("odds", "events/{id}")
 * - The query parameters that shape the upstream request
 *
 * Credential parameters are stripped before the key is built, so the key text
 * is always safe to log.
 */

#ifndef ODDSGATE_CACHE_CACHE_KEY_HPP
#define ODDSGATE_CACHE_CACHE_KEY_HPP

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace oddsgate::cache {

/**
 * Ordered list of query parameters as (name, value) pairs
 */
using ParamList = std::vector<std::pair<std::string, std::string>>;

/**
 * Cache key - canonical text plus its 64-bit hash
 */
struct CacheKey {
    std::string text;
    std::uint64_t hash{0};

    bool operator==(const CacheKey& other) const {
        return hash == other.hash && text == other.text;
    }

    bool operator<(const CacheKey& other) const {
        return text < other.text;
    }

    /**
     * Canonical key text for logging/debugging
     */
    const std::string& to_string() const { return text; }
};

/**
 * Hash functor for use with std::unordered_map
 */
struct CacheKeyHash {
    std::size_t operator()(const CacheKey& key) const noexcept {
        return static_cast<std::size_t>(key.hash);
    }
};

/**
 * Generate a cache key from a resource path and its query parameters
 *
 * Parameters are sorted by name (stable, so duplicates keep caller order) and
 * percent-encoded before serialization; two requests that differ only in
 * parameter order map to the same key.
 *
 * @param resource_path Logical resource, e.g. "odds" or "events/abc123"
 * @param params Query parameters that affect the upstream request
 * @return Cache key
 */
CacheKey derive_cache_key(std::string_view resource_path, const ParamList& params);

/**
 * Check whether a parameter name carries the upstream credential
 * (case-insensitive match on "apiKey")
 */
bool is_credential_param(std::string_view name);

} // namespace oddsgate::cache

#endif // ODDSGATE_CACHE_CACHE_KEY_HPP
