/**
 * ODDSGATE - Caching Odds API Gateway
 * Metrics - process-wide counters behind GET /metrics
 */

#ifndef ODDSGATE_UTIL_METRICS_HPP
#define ODDSGATE_UTIL_METRICS_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>

namespace oddsgate::util {

/**
 * Point-in-time copy of every counter
 */
struct MetricsSnapshot {
    // Request metrics
    std::uint64_t requests_total{0};
    std::uint64_t requests_active{0};
    std::uint64_t requests_success{0};  // Status < 500
    std::uint64_t requests_error{0};    // Status >= 500

    // Cache metrics
    std::uint64_t cache_hits{0};
    std::uint64_t cache_misses{0};
    double cache_hit_rate{0.0};

    // Upstream metrics
    std::uint64_t upstream_requests{0};
    std::uint64_t upstream_non_2xx{0};
    std::uint64_t upstream_transport_errors{0};
    double upstream_latency_avg_ms{0.0};

    // System metrics
    std::uint64_t uptime_seconds{0};
    std::uint64_t connections_active{0};
    std::uint64_t connections_total{0};

    // Sections: requests, cache, upstream, system
    std::string to_json() const;
};

/**
 * Relaxed atomic counters; a snapshot is not a consistent cut across them.
 */
class Metrics {
public:
    static Metrics& instance();

    // Request tracking
    void request_started();
    void request_completed(bool success);

    // Cache tracking
    void cache_hit();
    void cache_miss();

    // Upstream tracking
    void upstream_response(int status_code, std::chrono::milliseconds latency);
    void upstream_transport_error();

    // Inbound sockets
    void connection_opened();
    void connection_closed();

    MetricsSnapshot snapshot() const;

private:
    Metrics();
    ~Metrics() = default;

    // Non-copyable
    Metrics(const Metrics&) = delete;
    Metrics& operator=(const Metrics&) = delete;

    std::atomic<std::uint64_t> requests_total_{0};
    std::atomic<std::uint64_t> requests_active_{0};
    std::atomic<std::uint64_t> requests_success_{0};
    std::atomic<std::uint64_t> requests_error_{0};

    std::atomic<std::uint64_t> cache_hits_{0};
    std::atomic<std::uint64_t> cache_misses_{0};

    std::atomic<std::uint64_t> upstream_requests_{0};
    std::atomic<std::uint64_t> upstream_non_2xx_{0};
    std::atomic<std::uint64_t> upstream_transport_errors_{0};
    std::atomic<std::uint64_t> upstream_latency_sum_ms_{0};

    std::atomic<std::uint64_t> connections_active_{0};
    std::atomic<std::uint64_t> connections_total_{0};

    std::chrono::steady_clock::time_point started_at_;
};

/**
 * Holds one request in requests_active until destroyed. The request counts
 * as an error unless set_status() recorded a status below 500, so an
 * exception thrown mid-request is still accounted for.
 */
class RequestScope {
public:
    RequestScope() { Metrics::instance().request_started(); }
    ~RequestScope() { Metrics::instance().request_completed(success_); }

    RequestScope(const RequestScope&) = delete;
    RequestScope& operator=(const RequestScope&) = delete;

    void set_status(int status_code) { success_ = status_code < 500; }

private:
    bool success_{false};
};

} // namespace oddsgate::util

#endif // ODDSGATE_UTIL_METRICS_HPP
