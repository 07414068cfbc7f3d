#include "proxy/router.hpp"
#include "server/listener.hpp"

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/write.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <catch2/catch.hpp>
#include <nlohmann/json.hpp>

#include <atomic>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>

using namespace oddsgate;
namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = asio::ip::tcp;

namespace {

class EmptyUpstream : public upstream::UpstreamClient {
public:
    upstream::UpstreamResponse fetch(const upstream::UpstreamRequest&) override {
        ++calls;
        return {200, "[]"};
    }

    std::atomic<int> calls{0};
};

server::ListenerConfig loopback() {
    return server::ListenerConfig{
        .bind_address = "127.0.0.1",
        .port = 0,
        .threads = 1,
        .stop_on_signal = false
    };
}

// Writes raw bytes to the listener and reads back one response
http::response<http::string_body> exchange(std::uint16_t port, const std::string& raw) {
    asio::io_context ioc;
    tcp::socket socket(ioc);
    socket.connect(tcp::endpoint(asio::ip::make_address("127.0.0.1"), port));
    asio::write(socket, asio::buffer(raw));

    beast::flat_buffer buffer;
    http::response<http::string_body> response;
    http::read(socket, buffer, response);
    return response;
}

struct RoutedListener {
    std::shared_ptr<EmptyUpstream> upstream = std::make_shared<EmptyUpstream>();
    std::shared_ptr<cache::ResponseCache> store = std::make_shared<cache::ResponseCache>();
    std::shared_ptr<proxy::Router> router = std::make_shared<proxy::Router>(
        std::make_shared<proxy::OddsProxy>(
            store, upstream, proxy::ResponseTransformer(proxy::BookmakerAllowList::defaults())),
        store);
    server::Listener listener{loopback()};

    RoutedListener() { listener.start(router->handler()); }
};

std::string error_of(const http::response<http::string_body>& response) {
    return nlohmann::json::parse(response.body()).at("error").get<std::string>();
}

} // namespace

TEST_CASE("Listener binds an ephemeral port when 0 is configured", "[listener]") {
    RoutedListener f;
    CHECK(f.listener.port() != 0);
}

TEST_CASE("Routed requests round-trip over a socket", "[listener]") {
    RoutedListener f;

    auto health = exchange(f.listener.port(),
                           "GET /health HTTP/1.1\r\nHost: localhost\r\nConnection: close\r\n\r\n");
    CHECK(health.result() == http::status::ok);
    CHECK(nlohmann::json::parse(health.body())["status"] == "healthy");
    CHECK(std::string(health[http::field::server]) == "ODDSGATE/0.1.0");
    CHECK(std::string(health["X-Request-ID"]).size() == 16);

    auto odds = exchange(f.listener.port(),
                         "GET /api/odds?sport=basketball_nba HTTP/1.1\r\n"
                         "Host: localhost\r\nX-Request-ID: trace-7\r\nConnection: close\r\n\r\n");
    CHECK(odds.result() == http::status::ok);
    CHECK(odds.body() == "[]");
    CHECK(std::string(odds["X-Request-ID"]) == "trace-7");
    CHECK(f.upstream->calls == 1);
}

TEST_CASE("Unparseable request line is answered with 400", "[listener]") {
    RoutedListener f;

    auto response = exchange(f.listener.port(), "NOT A REQUEST\r\n\r\n");

    CHECK(response.result() == http::status::bad_request);
    CHECK(error_of(response) == "Malformed HTTP request");
    CHECK_FALSE(response.keep_alive());
}

TEST_CASE("HTTP versions other than 1.0 and 1.1 are answered with 505", "[listener]") {
    RoutedListener f;

    auto response = exchange(f.listener.port(), "GET /health HTTP/2.0\r\nHost: localhost\r\n\r\n");

    CHECK(response.result() == http::status::http_version_not_supported);
    CHECK(error_of(response) == "Only HTTP/1.0 and HTTP/1.1 are supported");
    CHECK_FALSE(response.keep_alive());
}

TEST_CASE("A throwing handler is answered with 500", "[listener]") {
    server::Listener listener(loopback());
    listener.start([](const server::HttpRequest& request) -> server::HttpResponse {
        throw std::runtime_error("no route for " + request.target);
    });

    auto response = exchange(listener.port(),
                             "GET /boom HTTP/1.1\r\nHost: localhost\r\nConnection: close\r\n\r\n");

    CHECK(response.result() == http::status::internal_server_error);
    CHECK(error_of(response) == "Internal server error");
    CHECK(std::string(response[http::field::access_control_allow_origin]) == "*");
}

TEST_CASE("A stopped listener refuses new connections", "[listener]") {
    server::Listener listener(loopback());
    listener.start([](const server::HttpRequest&) { return server::HttpResponse{}; });

    listener.stop();
    listener.wait();

    asio::io_context ioc;
    tcp::socket socket(ioc);
    boost::system::error_code ec;
    socket.connect(tcp::endpoint(asio::ip::make_address("127.0.0.1"), listener.port()), ec);
    CHECK(ec.failed());
}
