/**
 * ODDSGATE - Caching Odds API Gateway
 * Query Parameters - request target parsing, per-endpoint defaults and TTL policy
 */

#ifndef ODDSGATE_PROXY_QUERY_PARAMS_HPP
#define ODDSGATE_PROXY_QUERY_PARAMS_HPP

#include "cache/cache_key.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace oddsgate::proxy {

/**
 * Endpoint flavour, selects defaults and the payload transform
 */
enum class EndpointKind {
    Collection,  // list odds for a sport
    Single       // odds for one event
};

/**
 * Request target split into path and decoded, ordered query parameters
 */
struct QueryParams {
    std::string path;
    cache::ParamList params;

    /**
     * First value for a name, if present
     */
    std::optional<std::string> get(std::string_view name) const;

    /**
     * First non-empty value for a name, or the fallback
     */
    std::string get_or(std::string_view name, std::string_view fallback) const;
};

/**
 * Split a request target ("/path?a=1&b=2") and decode its query string
 */
QueryParams parse_query(std::string_view target);

/**
 * Decode a URL component ('+' is a space, malformed escapes are kept literally)
 */
std::string url_decode(std::string_view value);

namespace defaults {
    constexpr std::string_view Sport = "americanfootball_nfl";
    constexpr std::string_view Regions = "us";
    constexpr std::string_view CollectionMarkets = "h2h,spreads,totals";
    constexpr std::string_view EventMarkets =
        "player_pass_yds,player_pass_tds,player_rush_yds,player_reception_yds,player_anytime_td";
    constexpr std::string_view OddsFormat = "american";
}

/**
 * Parameters that shape one upstream odds request
 */
struct OddsQuery {
    std::string sport;
    std::string regions;
    std::string markets;
    std::string odds_format;
    std::optional<std::string> ttl;  // Raw client value, coerced by TtlPolicy

    /**
     * Key-relevant parameters in a fixed order (no credential, no ttl)
     */
    cache::ParamList key_params() const;
};

/**
 * Read sport/regions/markets/oddsFormat/ttl with per-endpoint defaults.
 * Any client-supplied apiKey is ignored.
 */
OddsQuery make_odds_query(const QueryParams& query, EndpointKind kind);

/**
 * TTL coercion rules
 */
class TtlPolicy {
public:
    TtlPolicy() = default;
    TtlPolicy(std::chrono::seconds default_ttl, std::chrono::seconds min_ttl,
              std::chrono::seconds error_ttl);

    /**
     * Absent, empty, non-numeric or non-positive values give the default;
     * anything else is truncated and raised to the floor.
     */
    std::chrono::seconds effective_ttl(const std::optional<std::string>& raw) const;

    std::chrono::seconds default_ttl() const { return default_ttl_; }
    std::chrono::seconds min_ttl() const { return min_ttl_; }
    std::chrono::seconds error_ttl() const { return error_ttl_; }

private:
    std::chrono::seconds default_ttl_{60};
    std::chrono::seconds min_ttl_{10};
    std::chrono::seconds error_ttl_{10};
};

} // namespace oddsgate::proxy

#endif // ODDSGATE_PROXY_QUERY_PARAMS_HPP
