/**
 * ODDSGATE - Caching Odds API Gateway
 * Metrics Implementation
 */

#include "util/metrics.hpp"

#include <nlohmann/json.hpp>

namespace oddsgate::util {

Metrics::Metrics()
    : started_at_(std::chrono::steady_clock::now())
{
}

Metrics& Metrics::instance() {
    // Thread-safe lazy initialization (C++11 guarantees)
    static Metrics instance;
    return instance;
}

void Metrics::request_started() {
    requests_total_.fetch_add(1, std::memory_order_relaxed);
    requests_active_.fetch_add(1, std::memory_order_relaxed);
}

void Metrics::request_completed(bool success) {
    requests_active_.fetch_sub(1, std::memory_order_relaxed);
    if (success) {
        requests_success_.fetch_add(1, std::memory_order_relaxed);
    } else {
        requests_error_.fetch_add(1, std::memory_order_relaxed);
    }
}

void Metrics::cache_hit() {
    cache_hits_.fetch_add(1, std::memory_order_relaxed);
}

void Metrics::cache_miss() {
    cache_misses_.fetch_add(1, std::memory_order_relaxed);
}

void Metrics::upstream_response(int status_code, std::chrono::milliseconds latency) {
    upstream_requests_.fetch_add(1, std::memory_order_relaxed);
    if (status_code < 200 || status_code >= 300) {
        upstream_non_2xx_.fetch_add(1, std::memory_order_relaxed);
    }
    upstream_latency_sum_ms_.fetch_add(static_cast<std::uint64_t>(latency.count()),
                                       std::memory_order_relaxed);
}

void Metrics::upstream_transport_error() {
    upstream_transport_errors_.fetch_add(1, std::memory_order_relaxed);
}

void Metrics::connection_opened() {
    connections_active_.fetch_add(1, std::memory_order_relaxed);
    connections_total_.fetch_add(1, std::memory_order_relaxed);
}

void Metrics::connection_closed() {
    connections_active_.fetch_sub(1, std::memory_order_relaxed);
}

MetricsSnapshot Metrics::snapshot() const {
    MetricsSnapshot snap;

    snap.requests_total = requests_total_.load(std::memory_order_relaxed);
    snap.requests_active = requests_active_.load(std::memory_order_relaxed);
    snap.requests_success = requests_success_.load(std::memory_order_relaxed);
    snap.requests_error = requests_error_.load(std::memory_order_relaxed);

    snap.cache_hits = cache_hits_.load(std::memory_order_relaxed);
    snap.cache_misses = cache_misses_.load(std::memory_order_relaxed);
    auto cache_total = snap.cache_hits + snap.cache_misses;
    snap.cache_hit_rate = cache_total > 0
        ? static_cast<double>(snap.cache_hits) / static_cast<double>(cache_total)
        : 0.0;

    snap.upstream_requests = upstream_requests_.load(std::memory_order_relaxed);
    snap.upstream_non_2xx = upstream_non_2xx_.load(std::memory_order_relaxed);
    snap.upstream_transport_errors = upstream_transport_errors_.load(std::memory_order_relaxed);
    auto latency_sum = upstream_latency_sum_ms_.load(std::memory_order_relaxed);
    snap.upstream_latency_avg_ms = snap.upstream_requests > 0
        ? static_cast<double>(latency_sum) / static_cast<double>(snap.upstream_requests)
        : 0.0;

    snap.uptime_seconds = static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now() - started_at_).count());
    snap.connections_active = connections_active_.load(std::memory_order_relaxed);
    snap.connections_total = connections_total_.load(std::memory_order_relaxed);

    return snap;
}

std::string MetricsSnapshot::to_json() const {
    nlohmann::ordered_json j;

    j["requests"] = {
        {"total", requests_total},
        {"active", requests_active},
        {"success", requests_success},
        {"error", requests_error}
    };

    j["cache"] = {
        {"hits", cache_hits},
        {"misses", cache_misses},
        {"hit_rate", cache_hit_rate}
    };

    j["upstream"] = {
        {"requests", upstream_requests},
        {"non_2xx", upstream_non_2xx},
        {"transport_errors", upstream_transport_errors},
        {"latency_avg_ms", upstream_latency_avg_ms}
    };

    j["system"] = {
        {"uptime_seconds", uptime_seconds},
        {"connections_active", connections_active},
        {"connections_total", connections_total}
    };

    return j.dump(2);
}

} // namespace oddsgate::util
