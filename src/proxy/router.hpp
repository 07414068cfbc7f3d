/**
 * ODDSGATE - Caching Odds API Gateway
 * Router - Maps HTTP requests onto the odds handlers and service endpoints
 */

#ifndef ODDSGATE_PROXY_ROUTER_HPP
#define ODDSGATE_PROXY_ROUTER_HPP

#include "cache/response_cache.hpp"
#include "proxy/odds_proxy.hpp"
#include "server/http_message.hpp"

#include <memory>
#include <string>
#include <string_view>

namespace oddsgate::proxy {

/**
 * Route table:
 *   GET     /api/odds               list odds for a sport
 *   GET     /api/events/{id}        odds for one event (also /api/events?id=)
 *   OPTIONS /api/odds, /api/events  CORS preflight
 *   GET     /health                 liveness
 *   GET     /cache/stats            cache statistics
 *   GET     /metrics                metrics snapshot
 *   GET     /                       service info
 *
 * Every request produces one access log line.
 */
class Router : public std::enable_shared_from_this<Router> {
public:
    using Ptr = std::shared_ptr<Router>;

    Router(std::shared_ptr<OddsProxy> proxy, std::shared_ptr<cache::ResponseCache> cache);

    /**
     * Route one request and write its access log line
     */
    server::HttpResponse handle(const server::HttpRequest& request);

    /**
     * Request handler bound to this router, for server::Server::start
     */
    server::RequestHandler handler();

private:
    ProxyResult dispatch(const server::HttpRequest& request, const QueryParams& query);

    server::HttpResponse cache_stats() const;

    static server::HttpResponse json_response(server::http::status status, std::string body);
    static server::HttpResponse preflight_response();
    static server::HttpResponse method_not_allowed();
    static server::HttpResponse service_info();

    std::shared_ptr<OddsProxy> proxy_;
    std::shared_ptr<cache::ResponseCache> cache_;
};

/**
 * Event id from "/api/events/{id}" (decoded) or the "id" query parameter.
 * Empty when neither is present.
 */
std::string extract_event_id(const QueryParams& query);

/**
 * True for the paths served by the odds handlers
 */
bool is_odds_path(std::string_view path);

} // namespace oddsgate::proxy

#endif // ODDSGATE_PROXY_ROUTER_HPP
