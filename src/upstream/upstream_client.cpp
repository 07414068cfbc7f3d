/**
 * ODDSGATE - Caching Odds API Gateway
 * Upstream Client implementation
 */

#include "upstream/upstream_client.hpp"

#include <boost/asio/ssl.hpp>
#include <boost/beast/ssl.hpp>

#include <spdlog/spdlog.h>

#include <cctype>
#include <chrono>
#include <iomanip>
#include <sstream>

namespace oddsgate::upstream {

namespace {

constexpr char kUserAgent[] = "ODDSGATE/0.1.0";

std::string describe(const std::string& host, const std::string& log_target,
                     const std::string& stage, const beast::error_code& ec) {
    return "GET " + host + log_target + " failed: " + stage + ": " + ec.message();
}

} // anonymous namespace

std::string url_encode(std::string_view value) {
    std::ostringstream oss;
    oss << std::hex << std::uppercase << std::setfill('0');
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            oss << static_cast<char>(c);
        } else {
            oss << '%' << std::setw(2) << static_cast<int>(c);
        }
    }
    return oss.str();
}

std::string build_upstream_target(std::string_view base_path,
                                  const UpstreamRequest& request,
                                  std::string_view api_key)
{
    std::string target(base_path);
    while (!target.empty() && target.back() == '/') {
        target.pop_back();
    }

    target += "/sports/" + url_encode(request.sport);
    if (request.event_id) {
        target += "/events/" + url_encode(*request.event_id);
    }
    target += "/odds";

    target += "?regions=" + url_encode(request.regions);
    target += "&markets=" + url_encode(request.markets);
    target += "&oddsFormat=" + url_encode(request.odds_format);
    target += "&apiKey=" + url_encode(api_key);

    return target;
}

std::string redact_target(std::string_view target) {
    std::string result(target);

    std::size_t pos = 0;
    while ((pos = result.find("apiKey=", pos)) != std::string::npos) {
        // Only match at a parameter boundary
        if (pos != 0 && result[pos - 1] != '?' && result[pos - 1] != '&') {
            pos += 7;
            continue;
        }
        std::size_t value_start = pos + 7;
        std::size_t value_end = result.find('&', value_start);
        if (value_end == std::string::npos) {
            value_end = result.size();
        }
        result.replace(value_start, value_end - value_start, "***");
        pos = value_start + 3;
    }

    return result;
}

HttpUpstreamClient::HttpUpstreamClient(const HttpUpstreamConfig& config)
    : config_(config)
{
    if (config_.use_tls) {
        tls_context_ = std::make_unique<TlsContext>(config_.tls);
    }

    spdlog::debug("Upstream: client for {}://{}:{}{}",
                  config_.use_tls ? "https" : "http",
                  config_.host, config_.port, config_.base_path);
}

UpstreamResponse HttpUpstreamClient::fetch(const UpstreamRequest& request) {
    auto target = build_upstream_target(config_.base_path, request, config_.api_key);
    auto log_target = redact_target(target);

    spdlog::debug("Upstream: GET {}{}", config_.host, log_target);

    auto start_time = std::chrono::steady_clock::now();

    auto upstream_request = build_request(target);
    UpstreamResponse response = config_.use_tls
        ? fetch_tls(upstream_request, log_target)
        : fetch_plain(upstream_request, log_target);

    auto latency = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);

    spdlog::info("Upstream: {} for {} in {}ms ({} bytes)",
                 response.status_code, log_target, latency.count(), response.body.size());

    return response;
}

http::request<http::empty_body> HttpUpstreamClient::build_request(const std::string& target) const {
    http::request<http::empty_body> request{http::verb::get, target, 11};

    bool default_port = (config_.use_tls && config_.port == 443) ||
                        (!config_.use_tls && config_.port == 80);
    request.set(http::field::host,
                default_port ? config_.host : config_.host + ":" + std::to_string(config_.port));
    request.set(http::field::user_agent, kUserAgent);
    request.set(http::field::accept, "application/json");
    request.set(http::field::connection, "close");

    return request;
}

tcp::resolver::results_type HttpUpstreamClient::resolve(asio::io_context& ioc,
                                                        const std::string& log_target)
{
    tcp::resolver resolver(ioc);
    beast::error_code ec;
    auto results = resolver.resolve(config_.host, std::to_string(config_.port), ec);
    if (ec) {
        throw TransportError(describe(config_.host, log_target, "DNS resolution", ec));
    }
    return results;
}

template<typename Stream>
UpstreamResponse HttpUpstreamClient::read_response(Stream& stream, const std::string& log_target) {
    beast::flat_buffer buffer;
    http::response_parser<http::string_body> parser;
    parser.body_limit(config_.max_body_bytes);

    beast::error_code ec;
    http::read(stream, buffer, parser, ec);
    if (ec) {
        throw TransportError(describe(config_.host, log_target, "read", ec));
    }

    auto message = parser.release();
    return UpstreamResponse{static_cast<int>(message.result_int()), std::move(message.body())};
}

UpstreamResponse HttpUpstreamClient::fetch_plain(const http::request<http::empty_body>& request,
                                                 const std::string& log_target)
{
    asio::io_context ioc;
    beast::tcp_stream stream(ioc);
    beast::error_code ec;

    stream.connect(resolve(ioc, log_target), ec);
    if (ec) {
        throw TransportError(describe(config_.host, log_target, "connect", ec));
    }

    http::write(stream, request, ec);
    if (ec) {
        throw TransportError(describe(config_.host, log_target, "write", ec));
    }

    auto response = read_response(stream, log_target);

    stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    // not_connected is expected when the server closed first

    return response;
}

UpstreamResponse HttpUpstreamClient::fetch_tls(const http::request<http::empty_body>& request,
                                               const std::string& log_target)
{
    asio::io_context ioc;
    ssl::stream<beast::tcp_stream> stream(ioc, tls_context_->get_context());
    tls_context_->prepare_stream(stream, config_.host);

    beast::error_code ec;
    beast::get_lowest_layer(stream).connect(resolve(ioc, log_target), ec);
    if (ec) {
        throw TransportError(describe(config_.host, log_target, "connect", ec));
    }

    stream.handshake(ssl::stream_base::client, ec);
    if (ec) {
        throw TransportError(describe(config_.host, log_target, "TLS handshake", ec));
    }

    http::write(stream, request, ec);
    if (ec) {
        throw TransportError(describe(config_.host, log_target, "write", ec));
    }

    auto response = read_response(stream, log_target);

    stream.shutdown(ec);
    if (ec && ec != asio::error::eof && ec != ssl::error::stream_truncated) {
        spdlog::debug("Upstream: TLS shutdown: {}", ec.message());
    }

    return response;
}

} // namespace oddsgate::upstream
