#include "util/logger.hpp"
#include "util/metrics.hpp"

#include <catch2/catch.hpp>
#include <nlohmann/json.hpp>

using namespace oddsgate::util;

TEST_CASE("Access line format", "[logger]") {
    AccessLogEntry entry;
    entry.request_id = "abc";
    entry.client_ip = "10.0.0.1";
    entry.method = "GET";
    entry.path = "/api/odds";
    entry.status_code = 200;
    entry.response_size = 42;
    entry.latency = std::chrono::milliseconds(7);
    entry.cache_status = "HIT";

    CHECK(Logger::format_access(entry) == R"(abc 10.0.0.1 "GET /api/odds" 200 42 7ms HIT)");

    entry.request_id.clear();
    entry.client_ip.clear();
    entry.cache_status.clear();
    CHECK(Logger::format_access(entry) == R"(- - "GET /api/odds" 200 42 7ms -)");
}

TEST_CASE("Log level names", "[logger]") {
    CHECK(parse_level("DEBUG") == spdlog::level::debug);
    CHECK(parse_level("warn") == spdlog::level::warn);
    CHECK(parse_level("Warning") == spdlog::level::warn);
    CHECK(parse_level("err") == spdlog::level::err);
    CHECK(parse_level("off") == spdlog::level::off);
    CHECK_FALSE(parse_level("loud").has_value());
    CHECK_FALSE(parse_level("").has_value());
}

TEST_CASE("Request context sets and clears the thread's id", "[logger]") {
    CHECK(RequestContext::current_id().empty());
    {
        RequestContext context("req-1");
        CHECK(context.id() == "req-1");
        CHECK(RequestContext::current_id() == "req-1");
    }
    CHECK(RequestContext::current_id().empty());

    RequestContext generated;
    CHECK(generated.id().size() == 16);
    CHECK(generated.id().find_first_not_of("0123456789abcdef") == std::string::npos);
    CHECK(generated.id() != RequestContext::generate_id());
}

TEST_CASE("Metrics snapshot serializes every section", "[metrics]") {
    auto& metrics = Metrics::instance();
    auto before = metrics.snapshot();

    metrics.upstream_response(503, std::chrono::milliseconds(20));
    metrics.upstream_transport_error();

    auto after = metrics.snapshot();
    CHECK(after.upstream_requests == before.upstream_requests + 1);
    CHECK(after.upstream_non_2xx == before.upstream_non_2xx + 1);
    CHECK(after.upstream_transport_errors == before.upstream_transport_errors + 1);

    auto j = nlohmann::json::parse(after.to_json());
    CHECK(j.contains("requests"));
    CHECK(j.contains("cache"));
    CHECK(j["upstream"]["transport_errors"] == after.upstream_transport_errors);
    CHECK(j.contains("system"));
}
