/**
 * ODDSGATE - Caching Odds API Gateway
 * Odds Proxy - Cache-or-fetch handlers for the odds endpoints
 *
 * Each request runs the same sequence:
 *   params -> TTL -> key -> fresh hit? serve : fetch -> transform -> store
 * Any failure along the way is answered with a 500 that is never cached.
 */

#ifndef ODDSGATE_PROXY_ODDS_PROXY_HPP
#define ODDSGATE_PROXY_ODDS_PROXY_HPP

#include "cache/response_cache.hpp"
#include "proxy/query_params.hpp"
#include "proxy/response_transformer.hpp"
#include "server/http_message.hpp"
#include "upstream/upstream_client.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace oddsgate::proxy {

/**
 * How a handler produced its response
 */
enum class Outcome {
    CacheHit,  // Fresh entry served
    Upstream,  // Fetched (and stored), whatever the upstream status
    Error      // Local failure, 4xx/5xx produced by the proxy itself
};

/**
 * "HIT", "MISS" or "ERROR" for access logging
 */
std::string_view to_string(Outcome outcome);

/**
 * Handler result
 */
struct ProxyResult {
    server::HttpResponse response;
    Outcome outcome{Outcome::Error};
};

/**
 * Odds proxy - the two handlers sharing one store and one upstream client
 */
class OddsProxy {
public:
    OddsProxy(std::shared_ptr<cache::ResponseCache> cache,
              std::shared_ptr<upstream::UpstreamClient> upstream,
              ResponseTransformer transformer,
              TtlPolicy ttl_policy = {});

    // Non-copyable
    OddsProxy(const OddsProxy&) = delete;
    OddsProxy& operator=(const OddsProxy&) = delete;

    /**
     * List odds for a sport
     */
    ProxyResult list_odds(const QueryParams& query);

    /**
     * Odds for one event; an empty id is answered with 400
     */
    ProxyResult event_odds(const std::string& event_id, const QueryParams& query);

private:
    ProxyResult handle(EndpointKind kind, const std::string& resource_path,
                       const OddsQuery& query, const std::optional<std::string>& event_id);

    ProxyResult error_response(server::http::status status, std::string_view message) const;

    std::shared_ptr<cache::ResponseCache> cache_;
    std::shared_ptr<upstream::UpstreamClient> upstream_;
    ResponseTransformer transformer_;
    TtlPolicy ttl_policy_;
};

} // namespace oddsgate::proxy

#endif // ODDSGATE_PROXY_ODDS_PROXY_HPP
