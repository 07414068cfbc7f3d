/**
 * ODDSGATE - Caching Odds API Gateway
 * HTTP session implementation
 */

#include "server/session.hpp"
#include "util/metrics.hpp"

#include <boost/asio/dispatch.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <chrono>

namespace oddsgate::server {

namespace {

constexpr char kServerHeader[] = "ODDSGATE/0.1.0";
constexpr auto kIdleTimeout = std::chrono::seconds(30);

// Every parser failure Beast reports lives in the http error category
bool is_parse_error(const beast::error_code& ec) {
    return ec.category() == http::make_error_code(http::error::bad_method).category();
}

} // anonymous namespace

HttpSession::HttpSession(tcp::socket socket, RequestHandler handler)
    : stream_(std::move(socket))
    , handler_(std::move(handler))
{
    beast::error_code ec;
    auto peer = stream_.socket().remote_endpoint(ec);
    if (!ec) {
        peer_ip_ = peer.address().to_string();
    }
    util::Metrics::instance().connection_opened();
}

HttpSession::~HttpSession() {
    util::Metrics::instance().connection_closed();
}

void HttpSession::run() {
    boost::asio::dispatch(stream_.get_executor(),
                          beast::bind_front_handler(&HttpSession::read_next, shared_from_this()));
}

void HttpSession::read_next() {
    request_ = {};
    stream_.expires_after(kIdleTimeout);
    http::async_read(stream_, buffer_, request_,
                     beast::bind_front_handler(&HttpSession::on_read, shared_from_this()));
}

void HttpSession::on_read(beast::error_code ec, std::size_t) {
    if (ec == http::error::end_of_stream) {
        return close();
    }
    if (ec && is_parse_error(ec)) {
        spdlog::warn("Session: unparseable request from {}: {}", peer_ip_, ec.message());
        return send(error_reply(http::status::bad_request, "Malformed HTTP request"), false);
    }
    if (ec) {
        if (ec != beast::error::timeout && ec != boost::asio::error::operation_aborted) {
            spdlog::debug("Session: read from {} failed: {}", peer_ip_, ec.message());
        }
        return close();
    }

    if (request_.version() != 10 && request_.version() != 11) {
        return send(error_reply(http::status::http_version_not_supported,
                                "Only HTTP/1.0 and HTTP/1.1 are supported"), false);
    }

    bool keep_alive = request_.keep_alive();
    send(answer(), keep_alive);
}

HttpSession::Reply HttpSession::answer() {
    HttpRequest request{
        .method = request_.method(),
        .target = std::string(request_.target()),
        .client_ip = peer_ip_
    };
    if (auto id = request_.find("X-Request-ID"); id != request_.end()) {
        request.x_request_id = std::string(id->value());
    }

    HttpResponse response;
    try {
        response = handler_(request);
    } catch (const std::exception& e) {
        spdlog::error("Session: handler failed for {}: {}", request.target, e.what());
        return error_reply(http::status::internal_server_error, "Internal server error");
    }

    Reply reply{response.status, request_.version()};
    reply.set(http::field::content_type, response.content_type);
    for (const auto& [name, value] : response.headers) {
        reply.set(name, value);
    }
    reply.body() = std::move(response.body);
    return reply;
}

HttpSession::Reply HttpSession::error_reply(http::status status, std::string_view message) const {
    Reply reply{status, request_.version() == 10 ? 10u : 11u};
    reply.set(http::field::content_type, "application/json; charset=utf-8");
    reply.set(http::field::access_control_allow_origin, "*");
    reply.body() = nlohmann::json{{"error", std::string(message)}}.dump();
    return reply;
}

void HttpSession::send(Reply reply, bool keep_alive) {
    reply_ = std::move(reply);
    reply_.set(http::field::server, kServerHeader);
    reply_.keep_alive(keep_alive);
    reply_.prepare_payload();

    stream_.expires_after(kIdleTimeout);
    http::async_write(stream_, reply_,
                      beast::bind_front_handler(&HttpSession::on_sent, shared_from_this(), keep_alive));
}

void HttpSession::on_sent(bool keep_alive, beast::error_code ec, std::size_t) {
    if (ec || !keep_alive) {
        return close();
    }
    read_next();
}

void HttpSession::close() {
    beast::error_code ec;
    stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
}

} // namespace oddsgate::server
