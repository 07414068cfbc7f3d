/**
 * ODDSGATE - Caching Odds API Gateway
 * Odds Proxy implementation
 */

#include "proxy/odds_proxy.hpp"
#include "proxy/header_policy.hpp"
#include "util/logger.hpp"
#include "util/metrics.hpp"

#include <nlohmann/json.hpp>

#include <stdexcept>

namespace oddsgate::proxy {

namespace http = server::http;
using util::log_component::Proxy;

std::string_view to_string(Outcome outcome) {
    switch (outcome) {
        case Outcome::CacheHit: return "HIT";
        case Outcome::Upstream: return "MISS";
        case Outcome::Error:    return "ERROR";
    }
    return "ERROR";
}

OddsProxy::OddsProxy(std::shared_ptr<cache::ResponseCache> cache,
                     std::shared_ptr<upstream::UpstreamClient> upstream,
                     ResponseTransformer transformer,
                     TtlPolicy ttl_policy)
    : cache_(std::move(cache))
    , upstream_(std::move(upstream))
    , transformer_(std::move(transformer))
    , ttl_policy_(ttl_policy)
{
    if (!cache_ || !upstream_) {
        throw std::invalid_argument("OddsProxy requires a cache and an upstream client");
    }
}

ProxyResult OddsProxy::list_odds(const QueryParams& query) {
    auto odds_query = make_odds_query(query, EndpointKind::Collection);
    return handle(EndpointKind::Collection, "odds", odds_query, std::nullopt);
}

ProxyResult OddsProxy::event_odds(const std::string& event_id, const QueryParams& query) {
    if (event_id.empty()) {
        ODDSGATE_LOG_DEBUG(Proxy, "Rejecting event request without id");
        return error_response(http::status::bad_request, "Missing event id");
    }

    auto odds_query = make_odds_query(query, EndpointKind::Single);
    return handle(EndpointKind::Single, "events/" + event_id, odds_query, event_id);
}

ProxyResult OddsProxy::handle(EndpointKind kind, const std::string& resource_path,
                              const OddsQuery& query, const std::optional<std::string>& event_id) {
    auto& metrics = util::Metrics::instance();

    try {
        auto ttl = ttl_policy_.effective_ttl(query.ttl);
        auto key = cache::derive_cache_key(resource_path, query.key_params());

        if (auto cached = cache_->lookup(key, ttl)) {
            metrics.cache_hit();
            ODDSGATE_LOG_DEBUG(Proxy, "Cache HIT: key={}, ttl={}s", key.to_string(), ttl.count());

            ProxyResult result;
            result.response.status = static_cast<http::status>(cached->status_code);
            result.response.body = std::move(cached->body);
            apply_cache_headers(result.response, ttl);
            result.outcome = Outcome::CacheHit;
            return result;
        }

        metrics.cache_miss();
        ODDSGATE_LOG_DEBUG(Proxy, "Cache MISS: key={}, ttl={}s", key.to_string(), ttl.count());

        upstream::UpstreamRequest request{
            .sport = query.sport,
            .regions = query.regions,
            .markets = query.markets,
            .odds_format = query.odds_format,
            .event_id = event_id
        };

        auto started = std::chrono::steady_clock::now();
        upstream::UpstreamResponse fetched;
        try {
            fetched = upstream_->fetch(request);
        } catch (const upstream::TransportError&) {
            metrics.upstream_transport_error();
            throw;
        }
        metrics.upstream_response(fetched.status_code,
            std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - started));

        auto body = transformer_.transform(fetched.status_code, fetched.body, kind);

        // Error statuses are stored too, so a repeat within the TTL does not refetch
        cache_->put(key, cache_->make_entry(fetched.status_code, body));

        ProxyResult result;
        result.response.status = static_cast<http::status>(fetched.status_code);
        result.response.body = std::move(body);
        apply_cache_headers(result.response, ttl);
        result.outcome = Outcome::Upstream;
        return result;

    } catch (const std::exception& e) {
        ODDSGATE_LOG_ERROR(Proxy, "Request for {} failed: {}", resource_path, e.what());
        return error_response(http::status::internal_server_error, "Proxy error");
    }
}

ProxyResult OddsProxy::error_response(http::status status, std::string_view message) const {
    ProxyResult result;
    result.response.status = status;
    result.response.body = nlohmann::json{{"error", std::string(message)}}.dump();
    apply_cache_headers(result.response, ttl_policy_.error_ttl());
    result.outcome = Outcome::Error;
    return result;
}

} // namespace oddsgate::proxy
