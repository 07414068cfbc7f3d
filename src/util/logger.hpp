/**
 * ODDSGATE - Caching Odds API Gateway
 * Logger - spdlog setup, component tagging and the access log
 */

#ifndef ODDSGATE_UTIL_LOGGER_HPP
#define ODDSGATE_UTIL_LOGGER_HPP

#include <spdlog/spdlog.h>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace oddsgate::util {

struct LogConfig {
    spdlog::level::level_enum level{spdlog::level::info};
    std::string file_path;             // Empty logs to the console only
    std::size_t max_file_size_mb{100};
    std::size_t max_files{5};
    bool enable_console{true};
    bool enable_colors{true};
};

/**
 * One served request. Never carries the upstream credential.
 */
struct AccessLogEntry {
    std::string request_id;
    std::string client_ip;
    std::string method;
    std::string path;
    int status_code{0};
    std::size_t response_size{0};
    std::chrono::milliseconds latency{0};
    std::string cache_status;  // HIT, MISS or ERROR on odds routes, empty elsewhere
};

/**
 * Case-insensitive spdlog level name ("warn" and "err" included)
 */
std::optional<spdlog::level::level_enum> parse_level(std::string_view name);

/**
 * Process-wide pair of spdlog loggers: "oddsgate" for component messages and
 * "access" for one line per request. The first init() wins; instance()
 * before init() gets a console logger at info.
 */
class Logger {
public:
    static void init(const LogConfig& config);
    static Logger& instance();

    template<typename... Args>
    void log(spdlog::level::level_enum level, std::string_view component,
             spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (logger_->should_log(level)) {
            logger_->log(level, "[{}] {}", component, fmt::format(fmt, std::forward<Args>(args)...));
        }
    }

    void access(const AccessLogEntry& entry);

    /**
     * {id} {ip} "{method} {path}" {status} {bytes} {ms}ms {cache}, with "-"
     * for an empty id, ip or cache status
     */
    static std::string format_access(const AccessLogEntry& entry);

    void flush();

private:
    explicit Logger(const LogConfig& config);

    std::shared_ptr<spdlog::logger> logger_;
    std::shared_ptr<spdlog::logger> access_logger_;
};

/**
 * Binds a request id to the current thread for the lifetime of the object.
 * An empty id is replaced by a fresh 16-hex-digit one.
 */
class RequestContext {
public:
    explicit RequestContext(std::string request_id = "");
    ~RequestContext();

    RequestContext(const RequestContext&) = delete;
    RequestContext& operator=(const RequestContext&) = delete;

    const std::string& id() const { return request_id_; }

    static std::string current_id();
    static std::string generate_id();

private:
    std::string request_id_;
};

#define ODDSGATE_LOG_DEBUG(component, ...) \
    ::oddsgate::util::Logger::instance().log(::spdlog::level::debug, component, __VA_ARGS__)
#define ODDSGATE_LOG_INFO(component, ...) \
    ::oddsgate::util::Logger::instance().log(::spdlog::level::info, component, __VA_ARGS__)
#define ODDSGATE_LOG_WARN(component, ...) \
    ::oddsgate::util::Logger::instance().log(::spdlog::level::warn, component, __VA_ARGS__)
#define ODDSGATE_LOG_ERROR(component, ...) \
    ::oddsgate::util::Logger::instance().log(::spdlog::level::err, component, __VA_ARGS__)
#define ODDSGATE_LOG_CRITICAL(component, ...) \
    ::oddsgate::util::Logger::instance().log(::spdlog::level::critical, component, __VA_ARGS__)

namespace log_component {
    constexpr std::string_view Server = "gateway";
    constexpr std::string_view Proxy = "odds";
}

} // namespace oddsgate::util

#endif // ODDSGATE_UTIL_LOGGER_HPP
