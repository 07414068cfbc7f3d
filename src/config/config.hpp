/**
 * ODDSGATE - Caching Odds API Gateway
 * Configuration System - Supports JSON file, environment variables, and CLI args
 *
 * Configuration hierarchy (highest precedence first):
 * 1. Command-line arguments
 * 2. Environment variables (ODDSGATE_*)
 * 3. Configuration file (JSON)
 * 4. Default values
 *
 * The upstream API key is never part of the file or CLI surface; it is read
 * from the environment variable named by upstream.api_key_env.
 */

#ifndef ODDSGATE_CONFIG_CONFIG_HPP
#define ODDSGATE_CONFIG_CONFIG_HPP

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace oddsgate::config {

/**
 * Server configuration
 */
struct ServerSettings {
    std::uint16_t port{8080};
    std::size_t threads{0};  // 0 = hardware_concurrency
    std::string bind_address{"0.0.0.0"};
};

/**
 * Upstream odds provider configuration
 */
struct UpstreamSettings {
    std::string host{"api.the-odds-api.com"};
    std::uint16_t port{443};
    bool use_tls{true};
    std::string base_path{"/v4"};
    bool verify_peer{true};
    std::string ca_file;                      // Empty = system default verify paths
    std::string api_key_env{"ODDS_API_KEY"};  // Environment variable holding the key
    std::size_t max_body_mb{64};              // Largest upstream body accepted

    // Loaded from api_key_env only; never serialized
    std::string api_key;
};

/**
 * Cache configuration
 */
struct CacheSettings {
    std::uint32_t default_ttl_seconds{60};
    std::uint32_t min_ttl_seconds{10};
    std::uint32_t error_ttl_seconds{10};
    std::size_t max_entries{0};  // 0 = unbounded
};

/**
 * Bookmaker filter configuration
 */
struct FilterSettings {
    std::vector<std::string> bookmakers{
        "DraftKings", "FanDuel", "BetMGM", "Caesars", "BetRivers", "Resorts World Bet"};
};

/**
 * Logging configuration
 */
struct LogSettings {
    std::string level{"info"};
    std::string file;
    std::size_t max_file_size_mb{100};
    std::size_t max_files{5};
    bool enable_console{true};
    bool enable_colors{true};
};

/**
 * Complete application configuration
 */
struct Config {
    ServerSettings server;
    UpstreamSettings upstream;
    CacheSettings cache;
    FilterSettings filter;
    LogSettings logging;

    /**
     * Validate configuration and throw if invalid
     */
    void validate() const;
};

/**
 * Configuration manager - handles loading and parsing
 */
class ConfigManager {
public:
    ConfigManager();
    ~ConfigManager();

    // Non-copyable
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    /**
     * Parse command-line arguments and load configuration
     *
     * @param argc Argument count
     * @param argv Argument values
     * @return true if configuration loaded successfully, false if --help was requested
     * @throws std::runtime_error on configuration errors
     */
    bool load(int argc, char* argv[]);

    /**
     * Get the current configuration (thread-safe)
     */
    Config get_config() const;

    /**
     * Get the configuration file path
     */
    std::filesystem::path get_config_path() const;

    /**
     * Print help message to stdout
     */
    static void print_help(const char* program_name);

private:
    /**
     * Load configuration from JSON file
     */
    void load_from_file(const std::filesystem::path& path);

    /**
     * Apply environment variable overrides
     */
    void apply_environment_overrides();

    /**
     * Apply command-line argument overrides
     */
    void apply_cli_overrides(int argc, char* argv[]);

    /**
     * Read the upstream credential from its environment variable
     */
    void load_api_key();

    /**
     * Get environment variable value
     */
    static std::optional<std::string> get_env(const std::string& name);

    mutable std::mutex config_mutex_;
    Config config_;
    std::filesystem::path config_path_;
};

/**
 * Parse a boolean flag value ("true", "1", "yes", "on")
 */
bool parse_bool(const std::string& value);

// JSON serialization support
void to_json(nlohmann::json& j, const ServerSettings& s);
void from_json(const nlohmann::json& j, ServerSettings& s);
void to_json(nlohmann::json& j, const UpstreamSettings& u);
void from_json(const nlohmann::json& j, UpstreamSettings& u);
void to_json(nlohmann::json& j, const CacheSettings& c);
void from_json(const nlohmann::json& j, CacheSettings& c);
void to_json(nlohmann::json& j, const FilterSettings& f);
void from_json(const nlohmann::json& j, FilterSettings& f);
void to_json(nlohmann::json& j, const LogSettings& l);
void from_json(const nlohmann::json& j, LogSettings& l);
void to_json(nlohmann::json& j, const Config& c);
void from_json(const nlohmann::json& j, Config& c);

} // namespace oddsgate::config

#endif // ODDSGATE_CONFIG_CONFIG_HPP
