/**
 * ODDSGATE - Caching Odds API Gateway
 * TLS Context implementation
 */

#include "upstream/tls_context.hpp"
#include "upstream/upstream_client.hpp"

#include <spdlog/spdlog.h>

#include <openssl/err.h>
#include <openssl/ssl.h>

namespace oddsgate::upstream {

std::string last_ssl_error() {
    unsigned long err = ERR_get_error();
    if (err == 0) {
        return "unknown OpenSSL error";
    }
    char buf[256];
    ERR_error_string_n(err, buf, sizeof(buf));
    return std::string(buf);
}

TlsContext::TlsContext(const TlsConfig& config)
    : config_(config)
    , context_(ssl::context::tls_client)
{
    // TLS 1.2 minimum
    context_.set_options(
        ssl::context::default_workarounds |
        ssl::context::no_sslv2 |
        ssl::context::no_sslv3 |
        ssl::context::no_tlsv1 |
        ssl::context::no_tlsv1_1);

    if (config_.verify_peer) {
        boost::system::error_code ec;
        if (config_.ca_file.empty()) {
            context_.set_default_verify_paths(ec);
        } else {
            context_.load_verify_file(config_.ca_file.string(), ec);
        }
        if (ec) {
            throw TransportError("Failed to load CA certificates: " + ec.message());
        }
        context_.set_verify_mode(ssl::verify_peer);
    } else {
        spdlog::warn("TLS: upstream certificate verification is disabled");
        context_.set_verify_mode(ssl::verify_none);
    }

    spdlog::debug("TLS: client context ready (verify_peer={}, ca_file={})",
                  config_.verify_peer,
                  config_.ca_file.empty() ? "(system)" : config_.ca_file.string());
}

ssl::context& TlsContext::get_context() noexcept {
    return context_;
}

void TlsContext::prepare_stream(ssl::stream<beast::tcp_stream>& stream, const std::string& host) const {
    if (!SSL_set_tlsext_host_name(stream.native_handle(), host.c_str())) {
        throw TransportError("Failed to set SNI hostname '" + host + "': " + last_ssl_error());
    }

    if (config_.verify_peer) {
        stream.set_verify_callback(ssl::host_name_verification(host));
    }
}

} // namespace oddsgate::upstream
