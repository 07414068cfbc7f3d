/**
 * ODDSGATE - Caching Odds API Gateway
 * TLS Context - Client-side SSL/TLS configuration for upstream connections
 */

#ifndef ODDSGATE_UPSTREAM_TLS_CONTEXT_HPP
#define ODDSGATE_UPSTREAM_TLS_CONTEXT_HPP

#include <utility>  // boost/asio/awaitable.hpp (1.74) uses std::exchange without including it
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>

#include <filesystem>
#include <string>

namespace oddsgate::upstream {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace ssl = asio::ssl;

/**
 * Client TLS configuration
 */
struct TlsConfig {
    bool verify_peer{true};             // Verify the upstream certificate chain and hostname
    std::filesystem::path ca_file;      // Optional CA bundle (PEM); empty = system defaults
};

/**
 * TLS Context - owns the ssl::context used for upstream connections
 *
 * Supports:
 * - TLS 1.2 and TLS 1.3 only
 * - Peer verification against system or configured CA certificates
 * - SNI and hostname verification per connection
 */
class TlsContext {
public:
    /**
     * @throws TransportError if the CA bundle cannot be loaded
     */
    explicit TlsContext(const TlsConfig& config);

    ~TlsContext() = default;

    TlsContext(const TlsContext&) = delete;
    TlsContext& operator=(const TlsContext&) = delete;

    /**
     * Get the underlying context
     */
    ssl::context& get_context() noexcept;

    /**
     * Set SNI and, when verification is enabled, the expected peer hostname
     * @throws TransportError with the OpenSSL reason on failure
     */
    void prepare_stream(ssl::stream<beast::tcp_stream>& stream, const std::string& host) const;

private:
    TlsConfig config_;
    ssl::context context_;
};

/**
 * Get the most recent OpenSSL error as a string
 */
std::string last_ssl_error();

} // namespace oddsgate::upstream

#endif // ODDSGATE_UPSTREAM_TLS_CONTEXT_HPP
