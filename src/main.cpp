/**
 * ODDSGATE - Caching Odds API Gateway
 *
 * A C++20 caching, filtering reverse proxy in front of a sports-odds API.
 */

#include "config/config.hpp"
#include "server/listener.hpp"
#include "cache/response_cache.hpp"
#include "proxy/odds_proxy.hpp"
#include "proxy/response_transformer.hpp"
#include "proxy/router.hpp"
#include "upstream/upstream_client.hpp"
#include "util/logger.hpp"

#include <algorithm>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <thread>

int main(int argc, char* argv[]) {
    using namespace oddsgate;
    using util::log_component::Server;

    try {
        // Load configuration
        config::ConfigManager config_manager;
        if (!config_manager.load(argc, argv)) {
            // --help was requested
            return 0;
        }

        auto config = config_manager.get_config();

        auto level = util::parse_level(config.logging.level);
        util::Logger::init(util::LogConfig{
            .level = level.value_or(spdlog::level::info),
            .file_path = config.logging.file,
            .max_file_size_mb = config.logging.max_file_size_mb,
            .max_files = config.logging.max_files,
            .enable_console = config.logging.enable_console,
            .enable_colors = config.logging.enable_colors
        });
        if (!level) {
            ODDSGATE_LOG_WARN(Server, "Unknown log level '{}', using info", config.logging.level);
        }

        ODDSGATE_LOG_INFO(Server, "ODDSGATE Caching Odds API Gateway v0.1.0");

        server::ListenerConfig listener_config{
            .bind_address = config.server.bind_address,
            .port = config.server.port,
            .threads = config.server.threads > 0
                ? config.server.threads
                : std::max<std::size_t>(1, std::thread::hardware_concurrency())
        };

        ODDSGATE_LOG_INFO(Server, "Configuration: port={}, threads={}, bind={}",
                          listener_config.port, listener_config.threads, listener_config.bind_address);

        // Upstream client
        upstream::HttpUpstreamConfig upstream_config;
        upstream_config.host = config.upstream.host;
        upstream_config.port = config.upstream.port;
        upstream_config.use_tls = config.upstream.use_tls;
        upstream_config.base_path = config.upstream.base_path;
        upstream_config.api_key = config.upstream.api_key;
        upstream_config.max_body_bytes = static_cast<std::uint64_t>(config.upstream.max_body_mb) * 1024 * 1024;
        upstream_config.tls.verify_peer = config.upstream.verify_peer;
        upstream_config.tls.ca_file = config.upstream.ca_file;

        auto upstream_client = std::make_shared<upstream::HttpUpstreamClient>(upstream_config);
        ODDSGATE_LOG_INFO(Server, "Upstream: {}://{}:{}{}",
                          config.upstream.use_tls ? "https" : "http",
                          config.upstream.host, config.upstream.port, config.upstream.base_path);

        // Response cache
        cache::ResponseCacheConfig cache_config;
        cache_config.max_entries = config.cache.max_entries;
        auto response_cache = std::make_shared<cache::ResponseCache>(cache_config);

        proxy::TtlPolicy ttl_policy(
            std::chrono::seconds(config.cache.default_ttl_seconds),
            std::chrono::seconds(config.cache.min_ttl_seconds),
            std::chrono::seconds(config.cache.error_ttl_seconds));
        ODDSGATE_LOG_INFO(Server, "Cache: default_ttl={}s, min_ttl={}s, max_entries={}",
                          ttl_policy.default_ttl().count(), ttl_policy.min_ttl().count(),
                          config.cache.max_entries == 0 ? std::string("unbounded")
                                                        : std::to_string(config.cache.max_entries));

        proxy::ResponseTransformer transformer(
            proxy::BookmakerAllowList(config.filter.bookmakers));

        auto odds_proxy = std::make_shared<proxy::OddsProxy>(
            response_cache, upstream_client, std::move(transformer), ttl_policy);

        auto router = std::make_shared<proxy::Router>(odds_proxy, response_cache);

        server::Listener listener(listener_config);
        listener.start(router->handler());

        ODDSGATE_LOG_INFO(Server, "Server started successfully");
        ODDSGATE_LOG_INFO(Server, "Press Ctrl+C to stop");

        // Wait for shutdown (blocks until signal received)
        listener.wait();

        ODDSGATE_LOG_INFO(Server, "Server stopped gracefully");
        util::Logger::instance().flush();
        return 0;

    } catch (const std::exception& e) {
        ODDSGATE_LOG_CRITICAL(Server, "Fatal error: {}", e.what());
        return 1;
    }
}
