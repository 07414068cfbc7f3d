#include "proxy/router.hpp"
#include "util/metrics.hpp"

#include <catch2/catch.hpp>
#include <nlohmann/json.hpp>

#include <memory>
#include <stdexcept>
#include <vector>

using namespace oddsgate;
namespace http = server::http;

namespace {

class FakeUpstream : public upstream::UpstreamClient {
public:
    upstream::UpstreamResponse fetch(const upstream::UpstreamRequest& request) override {
        requests.push_back(request);
        return {200, R"([{"id":"e1","bookmakers":[{"title":"DraftKings"}]}])"};
    }

    std::vector<upstream::UpstreamRequest> requests;
};

struct Fixture {
    std::shared_ptr<FakeUpstream> upstream = std::make_shared<FakeUpstream>();
    std::shared_ptr<cache::ResponseCache> store = std::make_shared<cache::ResponseCache>();
    std::shared_ptr<proxy::OddsProxy> odds = std::make_shared<proxy::OddsProxy>(
        store, upstream, proxy::ResponseTransformer(proxy::BookmakerAllowList::defaults()));
    std::shared_ptr<proxy::Router> router = std::make_shared<proxy::Router>(odds, store);

    server::HttpResponse request(http::verb method, const std::string& target,
                                 const std::string& request_id = "") {
        server::HttpRequest req;
        req.method = method;
        req.target = target;
        req.client_ip = "10.0.0.1";
        req.x_request_id = request_id;
        return router->handle(req);
    }
};

std::optional<std::string> header(const server::HttpResponse& response, const std::string& name) {
    for (const auto& [n, v] : response.headers) {
        if (n == name) {
            return v;
        }
    }
    return std::nullopt;
}

} // namespace

TEST_CASE("GET /api/odds reaches the list handler", "[router]") {
    Fixture f;
    auto response = f.request(http::verb::get, "/api/odds?sport=basketball_nba");

    CHECK(response.status == http::status::ok);
    REQUIRE(f.upstream->requests.size() == 1);
    CHECK(f.upstream->requests[0].sport == "basketball_nba");
    CHECK_FALSE(f.upstream->requests[0].event_id.has_value());
}

TEST_CASE("Event id comes from the path or the id parameter", "[router]") {
    Fixture f;

    f.request(http::verb::get, "/api/events/abc%20123");
    f.request(http::verb::get, "/api/events?id=xyz");

    REQUIRE(f.upstream->requests.size() == 2);
    CHECK(f.upstream->requests[0].event_id == "abc 123");
    CHECK(f.upstream->requests[1].event_id == "xyz");
}

TEST_CASE("Event request without id is a 400", "[router]") {
    Fixture f;

    CHECK(f.request(http::verb::get, "/api/events").status == http::status::bad_request);
    CHECK(f.request(http::verb::get, "/api/events/").status == http::status::bad_request);
    CHECK(f.upstream->requests.empty());
}

TEST_CASE("Preflight and method checks on proxy paths", "[router]") {
    Fixture f;

    auto preflight = f.request(http::verb::options, "/api/odds");
    CHECK(preflight.status == http::status::no_content);
    CHECK(header(preflight, "Access-Control-Allow-Methods") == "GET, OPTIONS");
    CHECK(header(preflight, "Access-Control-Allow-Origin") == "*");

    auto post = f.request(http::verb::post, "/api/events/e1");
    CHECK(post.status == http::status::method_not_allowed);
    CHECK(header(post, "Allow") == "GET, OPTIONS");

    CHECK(f.upstream->requests.empty());
}

TEST_CASE("Service endpoints", "[router]") {
    Fixture f;

    auto health = f.request(http::verb::get, "/health");
    CHECK(health.status == http::status::ok);
    CHECK(health.body == R"({"status":"healthy"})");

    f.request(http::verb::get, "/api/odds");
    f.request(http::verb::get, "/api/odds");
    auto stats = nlohmann::json::parse(f.request(http::verb::get, "/cache/stats").body);
    CHECK(stats["hits"] == 1);
    CHECK(stats["misses"] == 1);
    CHECK(stats["entries"] == 1);

    auto metrics = nlohmann::json::parse(f.request(http::verb::get, "/metrics").body);
    CHECK(metrics.contains("requests"));
    CHECK(metrics.contains("upstream"));

    auto info = nlohmann::json::parse(f.request(http::verb::get, "/").body);
    CHECK(info["name"] == "ODDSGATE");
}

TEST_CASE("Unknown paths are 404", "[router]") {
    Fixture f;

    auto response = f.request(http::verb::get, "/api/unknown");
    CHECK(response.status == http::status::not_found);
    CHECK(response.body == R"({"error":"Not found"})");
    CHECK(f.request(http::verb::get, "/api/events/a/b").status == http::status::not_found);
    CHECK(f.request(http::verb::delete_, "/health").status == http::status::not_found);
}

TEST_CASE("Request id is echoed or generated", "[router]") {
    Fixture f;

    CHECK(header(f.request(http::verb::get, "/health", "req-42"), "X-Request-ID") == "req-42");

    auto generated = header(f.request(http::verb::get, "/health"), "X-Request-ID");
    REQUIRE(generated.has_value());
    CHECK(generated->size() == 16);
}

TEST_CASE("Handled requests leave the active gauge where it was", "[router][metrics]") {
    Fixture f;
    auto& metrics = util::Metrics::instance();
    auto before = metrics.snapshot();

    f.request(http::verb::get, "/api/odds");
    f.request(http::verb::get, "/nowhere");

    auto after = metrics.snapshot();
    CHECK(after.requests_active == before.requests_active);
    CHECK(after.requests_total == before.requests_total + 2);
    CHECK(after.requests_success == before.requests_success + 2);
}

TEST_CASE("A request scope unwound by an exception completes as an error", "[router][metrics]") {
    auto& metrics = util::Metrics::instance();
    auto before = metrics.snapshot();

    try {
        util::RequestScope scope;
        CHECK(metrics.snapshot().requests_active == before.requests_active + 1);
        throw std::runtime_error("dispatch failed");
    } catch (const std::runtime_error&) {
    }

    auto after = metrics.snapshot();
    CHECK(after.requests_active == before.requests_active);
    CHECK(after.requests_error == before.requests_error + 1);
}

TEST_CASE("Odds path matching", "[router]") {
    CHECK(proxy::is_odds_path("/api/odds"));
    CHECK(proxy::is_odds_path("/api/events"));
    CHECK(proxy::is_odds_path("/api/events/"));
    CHECK(proxy::is_odds_path("/api/events/abc"));
    CHECK_FALSE(proxy::is_odds_path("/api/events/abc/odds"));
    CHECK_FALSE(proxy::is_odds_path("/api/oddsx"));
    CHECK_FALSE(proxy::is_odds_path("/"));
}
