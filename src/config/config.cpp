/**
 * ODDSGATE - Caching Odds API Gateway
 * Configuration System Implementation
 */

#include "config/config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace oddsgate::config {

// JSON serialization implementations
void to_json(nlohmann::json& j, const ServerSettings& s) {
    j = nlohmann::json{
        {"port", s.port},
        {"threads", s.threads},
        {"bind_address", s.bind_address}
    };
}

void from_json(const nlohmann::json& j, ServerSettings& s) {
    if (j.contains("port")) j.at("port").get_to(s.port);
    if (j.contains("threads")) j.at("threads").get_to(s.threads);
    if (j.contains("bind_address")) j.at("bind_address").get_to(s.bind_address);
}

void to_json(nlohmann::json& j, const UpstreamSettings& u) {
    j = nlohmann::json{
        {"host", u.host},
        {"port", u.port},
        {"use_tls", u.use_tls},
        {"base_path", u.base_path},
        {"verify_peer", u.verify_peer},
        {"ca_file", u.ca_file},
        {"api_key_env", u.api_key_env},
        {"max_body_mb", u.max_body_mb}
    };
}

void from_json(const nlohmann::json& j, UpstreamSettings& u) {
    if (j.contains("host")) j.at("host").get_to(u.host);
    if (j.contains("port")) j.at("port").get_to(u.port);
    if (j.contains("use_tls")) j.at("use_tls").get_to(u.use_tls);
    if (j.contains("base_path")) j.at("base_path").get_to(u.base_path);
    if (j.contains("verify_peer")) j.at("verify_peer").get_to(u.verify_peer);
    if (j.contains("ca_file")) j.at("ca_file").get_to(u.ca_file);
    if (j.contains("api_key_env")) j.at("api_key_env").get_to(u.api_key_env);
    if (j.contains("max_body_mb")) j.at("max_body_mb").get_to(u.max_body_mb);
}

void to_json(nlohmann::json& j, const CacheSettings& c) {
    j = nlohmann::json{
        {"default_ttl_seconds", c.default_ttl_seconds},
        {"min_ttl_seconds", c.min_ttl_seconds},
        {"error_ttl_seconds", c.error_ttl_seconds},
        {"max_entries", c.max_entries}
    };
}

void from_json(const nlohmann::json& j, CacheSettings& c) {
    if (j.contains("default_ttl_seconds")) j.at("default_ttl_seconds").get_to(c.default_ttl_seconds);
    if (j.contains("min_ttl_seconds")) j.at("min_ttl_seconds").get_to(c.min_ttl_seconds);
    if (j.contains("error_ttl_seconds")) j.at("error_ttl_seconds").get_to(c.error_ttl_seconds);
    if (j.contains("max_entries")) j.at("max_entries").get_to(c.max_entries);
}

void to_json(nlohmann::json& j, const FilterSettings& f) {
    j = nlohmann::json{
        {"bookmakers", f.bookmakers}
    };
}

void from_json(const nlohmann::json& j, FilterSettings& f) {
    if (j.contains("bookmakers")) j.at("bookmakers").get_to(f.bookmakers);
}

void to_json(nlohmann::json& j, const LogSettings& l) {
    j = nlohmann::json{
        {"level", l.level},
        {"file", l.file},
        {"max_file_size_mb", l.max_file_size_mb},
        {"max_files", l.max_files},
        {"enable_console", l.enable_console},
        {"enable_colors", l.enable_colors}
    };
}

void from_json(const nlohmann::json& j, LogSettings& l) {
    if (j.contains("level")) j.at("level").get_to(l.level);
    if (j.contains("file")) j.at("file").get_to(l.file);
    if (j.contains("max_file_size_mb")) j.at("max_file_size_mb").get_to(l.max_file_size_mb);
    if (j.contains("max_files")) j.at("max_files").get_to(l.max_files);
    if (j.contains("enable_console")) j.at("enable_console").get_to(l.enable_console);
    if (j.contains("enable_colors")) j.at("enable_colors").get_to(l.enable_colors);
}

void to_json(nlohmann::json& j, const Config& c) {
    j = nlohmann::json{
        {"server", c.server},
        {"upstream", c.upstream},
        {"cache", c.cache},
        {"filter", c.filter},
        {"logging", c.logging}
    };
}

void from_json(const nlohmann::json& j, Config& c) {
    if (j.contains("server")) j.at("server").get_to(c.server);
    if (j.contains("upstream")) j.at("upstream").get_to(c.upstream);
    if (j.contains("cache")) j.at("cache").get_to(c.cache);
    if (j.contains("filter")) j.at("filter").get_to(c.filter);
    if (j.contains("logging")) j.at("logging").get_to(c.logging);
}

bool parse_bool(const std::string& value) {
    std::string lower(value);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return lower == "true" || lower == "1" || lower == "yes" || lower == "on";
}

// Config validation
void Config::validate() const {
    // Validate server settings
    if (server.port == 0) {
        throw std::runtime_error("Configuration error: server.port must be non-zero");
    }
    if (server.bind_address.empty()) {
        throw std::runtime_error("Configuration error: server.bind_address cannot be empty");
    }

    // Validate upstream settings
    if (upstream.host.empty()) {
        throw std::runtime_error("Configuration error: upstream.host cannot be empty");
    }
    if (upstream.port == 0) {
        throw std::runtime_error("Configuration error: upstream.port must be non-zero");
    }
    if (!upstream.base_path.empty() && upstream.base_path.front() != '/') {
        throw std::runtime_error("Configuration error: upstream.base_path must start with '/'");
    }
    if (upstream.api_key_env.empty()) {
        throw std::runtime_error("Configuration error: upstream.api_key_env cannot be empty");
    }
    if (upstream.max_body_mb == 0) {
        throw std::runtime_error("Configuration error: upstream.max_body_mb must be non-zero");
    }

    // Validate cache settings
    if (cache.min_ttl_seconds == 0) {
        throw std::runtime_error("Configuration error: cache.min_ttl_seconds must be non-zero");
    }
    if (cache.default_ttl_seconds < cache.min_ttl_seconds) {
        throw std::runtime_error("Configuration error: cache.default_ttl_seconds must be >= cache.min_ttl_seconds");
    }
    if (cache.error_ttl_seconds == 0) {
        throw std::runtime_error("Configuration error: cache.error_ttl_seconds must be non-zero");
    }

    // Validate filter settings
    for (std::size_t i = 0; i < filter.bookmakers.size(); ++i) {
        if (filter.bookmakers[i].empty()) {
            throw std::runtime_error("Configuration error: filter.bookmakers[" + std::to_string(i) + "] cannot be empty");
        }
    }

    spdlog::debug("Configuration validated successfully");
}

// ConfigManager implementation
ConfigManager::ConfigManager() = default;
ConfigManager::~ConfigManager() = default;

bool ConfigManager::load(int argc, char* argv[]) {
    std::lock_guard<std::mutex> lock(config_mutex_);

    // Start with defaults
    config_ = Config{};
    config_path_.clear();

    // First pass: look for --help or --config
    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);

        if (arg == "--help" || arg == "-h") {
            print_help(argv[0]);
            return false;
        }

        if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
            config_path_ = argv[++i];
        } else if (arg.starts_with("--config=")) {
            config_path_ = arg.substr(9);
        }
    }

    // Load from config file if specified
    if (!config_path_.empty()) {
        load_from_file(config_path_);
    }

    // Apply environment variable overrides
    apply_environment_overrides();

    // Apply CLI overrides (highest precedence)
    apply_cli_overrides(argc, argv);

    // Credential comes from the environment only
    load_api_key();

    // Validate final configuration
    config_.validate();

    spdlog::info("Configuration loaded successfully");
    return true;
}

Config ConfigManager::get_config() const {
    std::lock_guard<std::mutex> lock(config_mutex_);
    return config_;
}

std::filesystem::path ConfigManager::get_config_path() const {
    std::lock_guard<std::mutex> lock(config_mutex_);
    return config_path_;
}

void ConfigManager::print_help(const char* program_name) {
    std::cout << "ODDSGATE - Caching Odds API Gateway\n"
              << "\n"
              << "Usage: " << program_name << " [OPTIONS]\n"
              << "\n"
              << "Options:\n"
              << "  -h, --help              Show this help message and exit\n"
              << "  -c, --config FILE       Path to JSON configuration file\n"
              << "  -p, --port PORT         Server HTTP port (default: 8080)\n"
              << "  -t, --threads NUM       Number of I/O threads (default: CPU cores)\n"
              << "  -b, --bind ADDRESS      Bind address (default: 0.0.0.0)\n"
              << "  --upstream-host HOST    Odds API host (default: api.the-odds-api.com)\n"
              << "  --upstream-port PORT    Odds API port (default: 443)\n"
              << "\n"
              << "Environment Variables:\n"
              << "  ODDS_API_KEY                 Upstream API key (name set by upstream.api_key_env)\n"
              << "  ODDSGATE_CONFIG              Path to configuration file\n"
              << "  ODDSGATE_PORT                Server HTTP port\n"
              << "  ODDSGATE_THREADS             Number of I/O threads\n"
              << "  ODDSGATE_BIND                Bind address\n"
              << "  ODDSGATE_UPSTREAM_HOST       Odds API host\n"
              << "  ODDSGATE_UPSTREAM_PORT       Odds API port\n"
              << "  ODDSGATE_UPSTREAM_TLS        Use TLS to upstream (true/false)\n"
              << "  ODDSGATE_UPSTREAM_VERIFY     Verify upstream certificate (true/false)\n"
              << "  ODDSGATE_CACHE_TTL           Default cache TTL in seconds\n"
              << "  ODDSGATE_CACHE_MAX_ENTRIES   Cache entry bound (0 = unbounded)\n"
              << "  ODDSGATE_LOG_LEVEL           Log level (trace/debug/info/warn/error/critical/off)\n"
              << "  ODDSGATE_LOG_FILE            Log file path (stdout if not set)\n"
              << "\n"
              << "Configuration Precedence (highest to lowest):\n"
              << "  1. Command-line arguments\n"
              << "  2. Environment variables\n"
              << "  3. Configuration file\n"
              << "  4. Default values\n"
              << "\n"
              << "Configuration File Format (JSON):\n"
              << "  {\n"
              << "    \"server\": {\"port\": 8080, \"threads\": 4},\n"
              << "    \"upstream\": {\n"
              << "      \"host\": \"api.the-odds-api.com\",\n"
              << "      \"port\": 443,\n"
              << "      \"use_tls\": true,\n"
              << "      \"base_path\": \"/v4\",\n"
              << "      \"api_key_env\": \"ODDS_API_KEY\",\n"
              << "      \"max_body_mb\": 64\n"
              << "    },\n"
              << "    \"cache\": {\n"
              << "      \"default_ttl_seconds\": 60,\n"
              << "      \"min_ttl_seconds\": 10,\n"
              << "      \"error_ttl_seconds\": 10,\n"
              << "      \"max_entries\": 0\n"
              << "    },\n"
              << "    \"filter\": {\"bookmakers\": [\"DraftKings\", \"FanDuel\"]},\n"
              << "    \"logging\": {\"level\": \"info\", \"file\": \"\"}\n"
              << "  }\n";
}

void ConfigManager::load_from_file(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        throw std::runtime_error("Configuration file not found: " + path.string());
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open configuration file: " + path.string());
    }

    try {
        nlohmann::json j = nlohmann::json::parse(file);
        config_ = j.get<Config>();
        spdlog::debug("Loaded configuration from {}", path.string());
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Invalid JSON in configuration file: " + std::string(e.what()));
    }
}

void ConfigManager::apply_environment_overrides() {
    // Check for config file path from environment
    if (config_path_.empty()) {
        if (auto env = get_env("ODDSGATE_CONFIG")) {
            config_path_ = *env;
            if (!config_path_.empty()) {
                load_from_file(config_path_);
            }
        }
    }

    // Server settings
    if (auto env = get_env("ODDSGATE_PORT")) {
        try {
            config_.server.port = static_cast<std::uint16_t>(std::stoul(*env));
            spdlog::debug("Applied ODDSGATE_PORT={}", config_.server.port);
        } catch (const std::logic_error&) {
            throw std::runtime_error("Invalid ODDSGATE_PORT value: " + *env);
        }
    }

    if (auto env = get_env("ODDSGATE_THREADS")) {
        try {
            config_.server.threads = std::stoul(*env);
            spdlog::debug("Applied ODDSGATE_THREADS={}", config_.server.threads);
        } catch (const std::logic_error&) {
            throw std::runtime_error("Invalid ODDSGATE_THREADS value: " + *env);
        }
    }

    if (auto env = get_env("ODDSGATE_BIND")) {
        config_.server.bind_address = *env;
        spdlog::debug("Applied ODDSGATE_BIND={}", config_.server.bind_address);
    }

    // Upstream settings
    if (auto env = get_env("ODDSGATE_UPSTREAM_HOST")) {
        config_.upstream.host = *env;
        spdlog::debug("Applied ODDSGATE_UPSTREAM_HOST={}", config_.upstream.host);
    }

    if (auto env = get_env("ODDSGATE_UPSTREAM_PORT")) {
        try {
            config_.upstream.port = static_cast<std::uint16_t>(std::stoul(*env));
            spdlog::debug("Applied ODDSGATE_UPSTREAM_PORT={}", config_.upstream.port);
        } catch (const std::logic_error&) {
            throw std::runtime_error("Invalid ODDSGATE_UPSTREAM_PORT value: " + *env);
        }
    }

    if (auto env = get_env("ODDSGATE_UPSTREAM_TLS")) {
        config_.upstream.use_tls = parse_bool(*env);
        spdlog::debug("Applied ODDSGATE_UPSTREAM_TLS={}", config_.upstream.use_tls);
    }

    if (auto env = get_env("ODDSGATE_UPSTREAM_VERIFY")) {
        config_.upstream.verify_peer = parse_bool(*env);
        spdlog::debug("Applied ODDSGATE_UPSTREAM_VERIFY={}", config_.upstream.verify_peer);
    }

    // Cache settings
    if (auto env = get_env("ODDSGATE_CACHE_TTL")) {
        try {
            config_.cache.default_ttl_seconds = static_cast<std::uint32_t>(std::stoul(*env));
            spdlog::debug("Applied ODDSGATE_CACHE_TTL={}", config_.cache.default_ttl_seconds);
        } catch (const std::logic_error&) {
            throw std::runtime_error("Invalid ODDSGATE_CACHE_TTL value: " + *env);
        }
    }

    if (auto env = get_env("ODDSGATE_CACHE_MAX_ENTRIES")) {
        try {
            config_.cache.max_entries = std::stoul(*env);
            spdlog::debug("Applied ODDSGATE_CACHE_MAX_ENTRIES={}", config_.cache.max_entries);
        } catch (const std::logic_error&) {
            throw std::runtime_error("Invalid ODDSGATE_CACHE_MAX_ENTRIES value: " + *env);
        }
    }

    // Logging settings
    if (auto env = get_env("ODDSGATE_LOG_LEVEL")) {
        config_.logging.level = *env;
        spdlog::debug("Applied ODDSGATE_LOG_LEVEL={}", config_.logging.level);
    }

    if (auto env = get_env("ODDSGATE_LOG_FILE")) {
        config_.logging.file = *env;
        spdlog::debug("Applied ODDSGATE_LOG_FILE={}", config_.logging.file);
    }
}

void ConfigManager::apply_cli_overrides(int argc, char* argv[]) {
    auto parse_port = [](const std::string& option, const std::string& value) {
        try {
            return static_cast<std::uint16_t>(std::stoul(value));
        } catch (const std::logic_error&) {
            throw std::runtime_error("Invalid " + option + " value: " + value);
        }
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);

        // Skip already processed args
        if (arg == "--help" || arg == "-h") continue;
        if (arg == "--config" || arg == "-c") { ++i; continue; }
        if (arg.starts_with("--config=")) continue;

        // Port
        if ((arg == "--port" || arg == "-p") && i + 1 < argc) {
            config_.server.port = parse_port("--port", argv[++i]);
        } else if (arg.starts_with("--port=")) {
            config_.server.port = parse_port("--port", arg.substr(7));
        }

        // Threads
        else if ((arg == "--threads" || arg == "-t") && i + 1 < argc) {
            std::string value = argv[++i];
            try {
                config_.server.threads = std::stoul(value);
            } catch (const std::logic_error&) {
                throw std::runtime_error("Invalid --threads value: " + value);
            }
        } else if (arg.starts_with("--threads=")) {
            try {
                config_.server.threads = std::stoul(arg.substr(10));
            } catch (const std::logic_error&) {
                throw std::runtime_error("Invalid --threads value: " + arg.substr(10));
            }
        }

        // Bind address
        else if ((arg == "--bind" || arg == "-b") && i + 1 < argc) {
            config_.server.bind_address = argv[++i];
        } else if (arg.starts_with("--bind=")) {
            config_.server.bind_address = arg.substr(7);
        }

        // Upstream
        else if (arg == "--upstream-host" && i + 1 < argc) {
            config_.upstream.host = argv[++i];
        } else if (arg.starts_with("--upstream-host=")) {
            config_.upstream.host = arg.substr(16);
        } else if (arg == "--upstream-port" && i + 1 < argc) {
            config_.upstream.port = parse_port("--upstream-port", argv[++i]);
        } else if (arg.starts_with("--upstream-port=")) {
            config_.upstream.port = parse_port("--upstream-port", arg.substr(16));
        }

        // Unknown argument (not an error)
    }
}

void ConfigManager::load_api_key() {
    if (auto env = get_env(config_.upstream.api_key_env)) {
        config_.upstream.api_key = *env;
        spdlog::debug("Upstream API key loaded from {}", config_.upstream.api_key_env);
    } else {
        config_.upstream.api_key.clear();
        spdlog::warn("{} is not set - upstream requests will be unauthenticated",
                     config_.upstream.api_key_env);
    }
}

std::optional<std::string> ConfigManager::get_env(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (value) {
        return std::string(value);
    }
    return std::nullopt;
}

} // namespace oddsgate::config
