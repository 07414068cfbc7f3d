/**
 * ODDSGATE - Caching Odds API Gateway
 * Upstream Client - Fetches odds from the provider's HTTP API
 */

#ifndef ODDSGATE_UPSTREAM_UPSTREAM_CLIENT_HPP
#define ODDSGATE_UPSTREAM_UPSTREAM_CLIENT_HPP

#include "upstream/tls_context.hpp"

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace oddsgate::upstream {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = asio::ip::tcp;

/**
 * Transport-level failure reaching the provider (DNS, connect, TLS, I/O).
 * Never carries the credential.
 */
class TransportError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * Parameters of one upstream odds request
 */
struct UpstreamRequest {
    std::string sport;
    std::string regions;
    std::string markets;
    std::string odds_format;
    std::optional<std::string> event_id;  // Set for the single-event endpoint
};

/**
 * Raw upstream result, whatever the status
 */
struct UpstreamResponse {
    int status_code{0};
    std::string body;
};

/**
 * Upstream fetcher interface
 *
 * One call performs exactly one upstream GET. Non-2xx statuses are returned
 * normally; only transport faults throw TransportError.
 */
class UpstreamClient {
public:
    virtual ~UpstreamClient() = default;

    virtual UpstreamResponse fetch(const UpstreamRequest& request) = 0;
};

/**
 * HTTP client configuration
 */
struct HttpUpstreamConfig {
    std::string host{"api.the-odds-api.com"};
    std::uint16_t port{443};
    bool use_tls{true};
    std::string base_path{"/v4"};
    std::string api_key;
    std::uint64_t max_body_bytes{64ull * 1024 * 1024};  // Beast's parser default is 8 MiB
    TlsConfig tls{};
};

/**
 * Boost.Beast implementation of UpstreamClient
 *
 * Opens a fresh connection per fetch (Connection: close); no retries and no
 * timeouts beyond the socket defaults.
 */
class HttpUpstreamClient : public UpstreamClient {
public:
    explicit HttpUpstreamClient(const HttpUpstreamConfig& config);
    ~HttpUpstreamClient() override = default;

    HttpUpstreamClient(const HttpUpstreamClient&) = delete;
    HttpUpstreamClient& operator=(const HttpUpstreamClient&) = delete;

    UpstreamResponse fetch(const UpstreamRequest& request) override;

    const HttpUpstreamConfig& config() const { return config_; }

private:
    http::request<http::empty_body> build_request(const std::string& target) const;

    UpstreamResponse fetch_plain(const http::request<http::empty_body>& request,
                                 const std::string& log_target);
    UpstreamResponse fetch_tls(const http::request<http::empty_body>& request,
                               const std::string& log_target);

    tcp::resolver::results_type resolve(asio::io_context& ioc, const std::string& log_target);

    template<typename Stream>
    UpstreamResponse read_response(Stream& stream, const std::string& log_target);

    HttpUpstreamConfig config_;
    std::unique_ptr<TlsContext> tls_context_;
};

/**
 * Percent-encode a value for use in a URL (RFC 3986 unreserved kept)
 */
std::string url_encode(std::string_view value);

/**
 * Build the upstream request target (path + query), credential included
 *
 * {base}/sports/{sport}/odds?regions=..&markets=..&oddsFormat=..&apiKey=..
 * {base}/sports/{sport}/events/{id}/odds?...
 */
std::string build_upstream_target(std::string_view base_path,
                                  const UpstreamRequest& request,
                                  std::string_view api_key);

/**
 * Replace the apiKey query value with "***" for logging
 */
std::string redact_target(std::string_view target);

} // namespace oddsgate::upstream

#endif // ODDSGATE_UPSTREAM_UPSTREAM_CLIENT_HPP
