#include "upstream/upstream_client.hpp"

#include <catch2/catch.hpp>

#include <string>
#include <thread>

using namespace oddsgate::upstream;

namespace {

// Serves one canned reply on 127.0.0.1 and keeps the request it received
class CannedUpstream {
public:
    CannedUpstream(http::status status, std::string body)
        : acceptor_(ioc_, tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0))
        , port_(acceptor_.local_endpoint().port())
        , status_(status)
        , body_(std::move(body))
        , thread_([this] { serve(); })
    {
    }

    ~CannedUpstream() { join(); }

    std::uint16_t port() const { return port_; }

    const http::request<http::string_body>& received() {
        join();
        return received_;
    }

private:
    void join() {
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    void serve() {
        beast::error_code ec;
        tcp::socket socket(ioc_);
        acceptor_.accept(socket, ec);
        if (ec) {
            return;
        }
        beast::flat_buffer buffer;
        http::read(socket, buffer, received_, ec);
        if (ec) {
            return;
        }
        http::response<http::string_body> reply{status_, 11};
        reply.set(http::field::content_type, "application/json");
        reply.body() = body_;
        reply.prepare_payload();
        http::write(socket, reply, ec);
        socket.shutdown(tcp::socket::shutdown_both, ec);
    }

    asio::io_context ioc_;
    tcp::acceptor acceptor_;
    std::uint16_t port_;
    http::status status_;
    std::string body_;
    http::request<http::string_body> received_;
    std::thread thread_;
};

HttpUpstreamConfig local_config(std::uint16_t port) {
    HttpUpstreamConfig config;
    config.host = "127.0.0.1";
    config.port = port;
    config.use_tls = false;
    config.api_key = "SECRET";
    return config;
}

UpstreamRequest nfl_request() {
    return UpstreamRequest{
        .sport = "americanfootball_nfl",
        .regions = "us",
        .markets = "h2h",
        .odds_format = "american"
    };
}

} // namespace

TEST_CASE("Collection target", "[upstream][target]") {
    UpstreamRequest request{
        .sport = "americanfootball_nfl",
        .regions = "us",
        .markets = "h2h,spreads,totals",
        .odds_format = "american"
    };

    CHECK(build_upstream_target("/v4", request, "KEY123") ==
          "/v4/sports/americanfootball_nfl/odds"
          "?regions=us&markets=h2h%2Cspreads%2Ctotals&oddsFormat=american&apiKey=KEY123");
}

TEST_CASE("Single-event target", "[upstream][target]") {
    UpstreamRequest request{
        .sport = "americanfootball_nfl",
        .regions = "us",
        .markets = "player_pass_yds",
        .odds_format = "decimal",
        .event_id = "abc123"
    };

    CHECK(build_upstream_target("/v4/", request, "k") ==
          "/v4/sports/americanfootball_nfl/events/abc123/odds"
          "?regions=us&markets=player_pass_yds&oddsFormat=decimal&apiKey=k");
}

TEST_CASE("Caller-influenced values cannot inject path or query parts", "[upstream][target]") {
    UpstreamRequest request{
        .sport = "nfl/../admin",
        .regions = "us&apiKey=evil",
        .markets = "h2h",
        .odds_format = "american",
        .event_id = "a b?c"
    };

    auto target = build_upstream_target("/v4", request, "real key");

    CHECK(target ==
          "/v4/sports/nfl%2F..%2Fadmin/events/a%20b%3Fc/odds"
          "?regions=us%26apiKey%3Devil&markets=h2h&oddsFormat=american&apiKey=real%20key");
}

TEST_CASE("URL encoding keeps unreserved characters", "[upstream]") {
    CHECK(url_encode("AZaz09-_.~") == "AZaz09-_.~");
    CHECK(url_encode("a,b") == "a%2Cb");
    CHECK(url_encode("\xff") == "%FF");
    CHECK(url_encode("") == "");
}

TEST_CASE("Redaction hides the credential value", "[upstream][credential]") {
    CHECK(redact_target("/v4/sports/x/odds?regions=us&apiKey=SECRET") ==
          "/v4/sports/x/odds?regions=us&apiKey=***");
    CHECK(redact_target("/odds?apiKey=SECRET&regions=us") == "/odds?apiKey=***&regions=us");
    CHECK(redact_target("/odds?myapiKey=keep&apiKey=SECRET") == "/odds?myapiKey=keep&apiKey=***");
    CHECK(redact_target("/odds?regions=us") == "/odds?regions=us");
}

TEST_CASE("Plain HTTP client builds without a TLS context", "[upstream]") {
    HttpUpstreamConfig config;
    config.use_tls = false;
    config.port = 80;

    HttpUpstreamClient client(config);
    CHECK(client.config().host == "api.the-odds-api.com");
    CHECK_FALSE(client.config().use_tls);
}

TEST_CASE("Unreachable upstream raises TransportError", "[upstream]") {
    HttpUpstreamConfig config;
    config.host = "127.0.0.1";
    config.port = 1;  // Nothing listens on tcpmux
    config.use_tls = false;
    config.api_key = "SECRET";

    HttpUpstreamClient client(config);
    UpstreamRequest request{
        .sport = "americanfootball_nfl",
        .regions = "us",
        .markets = "h2h",
        .odds_format = "american"
    };

    try {
        client.fetch(request);
        FAIL("fetch should have thrown");
    } catch (const TransportError& e) {
        CHECK(std::string(e.what()).find("SECRET") == std::string::npos);
    }
}

TEST_CASE("Fetch over a socket returns a non-2xx reply unchanged", "[upstream][socket]") {
    CannedUpstream provider(http::status::not_found, R"({"message":"not found"})");
    HttpUpstreamClient client(local_config(provider.port()));

    auto response = client.fetch(nfl_request());

    CHECK(response.status_code == 404);
    CHECK(response.body == R"({"message":"not found"})");

    const auto& sent = provider.received();
    CHECK(sent.method() == http::verb::get);
    CHECK(std::string(sent[http::field::accept]) == "application/json");
    CHECK(std::string(sent[http::field::host]) == "127.0.0.1:" + std::to_string(provider.port()));

    std::string target(sent.target());
    CHECK(target.rfind("/v4/sports/americanfootball_nfl/odds?", 0) == 0);
    CHECK(target.find("&apiKey=SECRET") != std::string::npos);
}

TEST_CASE("Bodies above Beast's 8 MiB default are read in full", "[upstream][socket]") {
    std::string big = "[\"" + std::string(9 * 1024 * 1024, 'x') + "\"]";
    CannedUpstream provider(http::status::ok, big);
    HttpUpstreamClient client(local_config(provider.port()));

    auto response = client.fetch(nfl_request());

    CHECK(response.status_code == 200);
    CHECK(response.body.size() == big.size());
}

TEST_CASE("Bodies above the configured limit raise TransportError", "[upstream][socket]") {
    CannedUpstream provider(http::status::ok, std::string(4096, ' '));
    auto config = local_config(provider.port());
    config.max_body_bytes = 1024;
    HttpUpstreamClient client(config);

    CHECK_THROWS_AS(client.fetch(nfl_request()), TransportError);
}
