/**
 * ODDSGATE - Caching Odds API Gateway
 * Logger implementation
 */

#include "util/logger.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/stdout_sinks.h>

#include <algorithm>
#include <cctype>
#include <mutex>
#include <random>
#include <vector>

namespace oddsgate::util {

namespace {

std::once_flag g_init_once;
std::unique_ptr<Logger> g_logger;

thread_local std::string tl_request_id;

} // anonymous namespace

std::optional<spdlog::level::level_enum> parse_level(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    // from_str maps every unknown name to off
    auto level = spdlog::level::from_str(lower);
    if (level == spdlog::level::off && lower != "off") {
        return std::nullopt;
    }
    return level;
}

Logger::Logger(const LogConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;
    if (config.enable_console) {
        if (config.enable_colors) {
            sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        } else {
            sinks.push_back(std::make_shared<spdlog::sinks::stdout_sink_mt>());
        }
    }
    if (!config.file_path.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.file_path, config.max_file_size_mb * 1024 * 1024, config.max_files));
    }

    logger_ = std::make_shared<spdlog::logger>("oddsgate", sinks.begin(), sinks.end());
    logger_->set_pattern("%Y-%m-%dT%H:%M:%S.%e %^%-5l%$ %v");
    logger_->set_level(config.level);
    logger_->flush_on(spdlog::level::warn);

    access_logger_ = std::make_shared<spdlog::logger>("access", sinks.begin(), sinks.end());
    access_logger_->set_pattern("%Y-%m-%dT%H:%M:%S.%e ACCESS %v");
    access_logger_->set_level(spdlog::level::info);

    // Modules that call spdlog:: directly share the same sinks and level
    spdlog::set_default_logger(logger_);
}

void Logger::init(const LogConfig& config) {
    std::call_once(g_init_once, [&config] { g_logger.reset(new Logger(config)); });
}

Logger& Logger::instance() {
    init(LogConfig{});
    return *g_logger;
}

void Logger::access(const AccessLogEntry& entry) {
    access_logger_->info(format_access(entry));
}

std::string Logger::format_access(const AccessLogEntry& entry) {
    auto or_dash = [](const std::string& value) -> std::string_view {
        return value.empty() ? std::string_view("-") : std::string_view(value);
    };
    return fmt::format(R"({} {} "{} {}" {} {} {}ms {})",
                       or_dash(entry.request_id), or_dash(entry.client_ip),
                       entry.method, entry.path, entry.status_code,
                       entry.response_size, entry.latency.count(),
                       or_dash(entry.cache_status));
}

void Logger::flush() {
    logger_->flush();
    access_logger_->flush();
}

RequestContext::RequestContext(std::string request_id)
    : request_id_(request_id.empty() ? generate_id() : std::move(request_id))
{
    tl_request_id = request_id_;
}

RequestContext::~RequestContext() {
    tl_request_id.clear();
}

std::string RequestContext::current_id() {
    return tl_request_id;
}

std::string RequestContext::generate_id() {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    return fmt::format("{:016x}", rng());
}

} // namespace oddsgate::util
