/**
 * ODDSGATE - Caching Odds API Gateway
 * Router implementation
 */

#include "proxy/router.hpp"
#include "proxy/header_policy.hpp"
#include "util/logger.hpp"
#include "util/metrics.hpp"

#include <nlohmann/json.hpp>

#include <chrono>

namespace oddsgate::proxy {

namespace http = server::http;
using server::HttpRequest;
using server::HttpResponse;

namespace {

constexpr std::string_view kOddsPath = "/api/odds";
constexpr std::string_view kEventsPath = "/api/events";
constexpr std::string_view kEventsPrefix = "/api/events/";

} // anonymous namespace

bool is_odds_path(std::string_view path) {
    if (path == kOddsPath || path == kEventsPath) {
        return true;
    }
    if (path.starts_with(kEventsPrefix)) {
        // Exactly one segment after the prefix (possibly empty)
        return path.substr(kEventsPrefix.size()).find('/') == std::string_view::npos;
    }
    return false;
}

std::string extract_event_id(const QueryParams& query) {
    std::string_view path = query.path;
    if (path.starts_with(kEventsPrefix)) {
        auto segment = path.substr(kEventsPrefix.size());
        if (!segment.empty()) {
            return url_decode(segment);
        }
    }
    return query.get("id").value_or("");
}

Router::Router(std::shared_ptr<OddsProxy> proxy, std::shared_ptr<cache::ResponseCache> cache)
    : proxy_(std::move(proxy))
    , cache_(std::move(cache))
{
}

server::RequestHandler Router::handler() {
    return [self = shared_from_this()](const HttpRequest& request) {
        return self->handle(request);
    };
}

HttpResponse Router::handle(const HttpRequest& request) {
    auto start = std::chrono::steady_clock::now();
    util::RequestContext context(request.x_request_id);

    util::RequestScope tracked;

    auto query = parse_query(request.target);
    auto result = dispatch(request, query);
    set_header(result.response, "X-Request-ID", context.id());

    auto status_code = static_cast<int>(result.response.status);
    tracked.set_status(status_code);

    util::AccessLogEntry entry;
    entry.request_id = context.id();
    entry.client_ip = request.client_ip;
    entry.method = std::string(http::to_string(request.method));
    entry.path = query.path;
    entry.status_code = status_code;
    entry.response_size = result.response.body.size();
    entry.latency = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    if (is_odds_path(query.path) && request.method == http::verb::get) {
        entry.cache_status = std::string(to_string(result.outcome));
    }
    util::Logger::instance().access(entry);

    return std::move(result.response);
}

ProxyResult Router::dispatch(const HttpRequest& request, const QueryParams& query) {
    const auto& path = query.path;

    if (is_odds_path(path)) {
        if (request.method == http::verb::options) {
            return {preflight_response(), Outcome::Upstream};
        }
        if (request.method != http::verb::get) {
            return {method_not_allowed(), Outcome::Error};
        }
        if (path == kOddsPath) {
            return proxy_->list_odds(query);
        }
        return proxy_->event_odds(extract_event_id(query), query);
    }

    if (request.method == http::verb::get) {
        if (path == "/health") {
            return {json_response(http::status::ok, R"({"status":"healthy"})"), Outcome::Upstream};
        }
        if (path == "/cache/stats") {
            return {cache_stats(), Outcome::Upstream};
        }
        if (path == "/metrics") {
            return {json_response(http::status::ok, util::Metrics::instance().snapshot().to_json()),
                    Outcome::Upstream};
        }
        if (path == "/") {
            return {service_info(), Outcome::Upstream};
        }
    }

    return {json_response(http::status::not_found, R"({"error":"Not found"})"), Outcome::Error};
}

HttpResponse Router::cache_stats() const {
    auto stats = cache_->get_stats();
    nlohmann::ordered_json j{
        {"hits", stats.hits},
        {"misses", stats.misses},
        {"stale", stats.stale},
        {"hit_rate", stats.hit_rate()},
        {"writes", stats.writes},
        {"evictions", stats.evictions},
        {"entries", stats.entries},
        {"size_bytes", stats.size_bytes},
        {"max_entries", stats.max_entries}
    };
    return json_response(http::status::ok, j.dump(2));
}

HttpResponse Router::json_response(http::status status, std::string body) {
    HttpResponse response{
        .status = status,
        .content_type = std::string(kJsonContentType),
        .body = std::move(body)
    };
    set_header(response, "Access-Control-Allow-Origin", "*");
    return response;
}

HttpResponse Router::preflight_response() {
    HttpResponse response{
        .status = http::status::no_content,
        .content_type = std::string(kJsonContentType)
    };
    set_header(response, "Access-Control-Allow-Origin", "*");
    set_header(response, "Access-Control-Allow-Methods", "GET, OPTIONS");
    set_header(response, "Access-Control-Allow-Headers", "Content-Type");
    set_header(response, "Access-Control-Max-Age", "86400");
    return response;
}

HttpResponse Router::method_not_allowed() {
    auto response = json_response(http::status::method_not_allowed, R"({"error":"Method not allowed"})");
    set_header(response, "Allow", "GET, OPTIONS");
    return response;
}

HttpResponse Router::service_info() {
    nlohmann::ordered_json j{
        {"name", "ODDSGATE"},
        {"version", "0.1.0"},
        {"description", "Caching Odds API Gateway"},
        {"endpoints", {
            {"odds", "/api/odds"},
            {"event_odds", "/api/events/{id}"},
            {"health", "/health"},
            {"cache_stats", "/cache/stats"},
            {"metrics", "/metrics"}
        }}
    };
    return json_response(http::status::ok, j.dump(2));
}

} // namespace oddsgate::proxy
