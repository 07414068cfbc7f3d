/**
 * ODDSGATE - Caching Odds API Gateway
 * Header Policy - CDN caching, content type and CORS headers for every response
 */

#ifndef ODDSGATE_PROXY_HEADER_POLICY_HPP
#define ODDSGATE_PROXY_HEADER_POLICY_HPP

#include "server/http_message.hpp"

#include <chrono>
#include <string>
#include <string_view>

namespace oddsgate::proxy {

constexpr std::string_view kJsonContentType = "application/json; charset=utf-8";

/**
 * "s-maxage={ttl}, stale-while-revalidate={round(ttl/2)}"
 */
std::string cache_control_value(std::chrono::seconds ttl);

/**
 * Set Cache-Control, Content-Type and Access-Control-Allow-Origin.
 * Existing values of those headers are replaced.
 */
void apply_cache_headers(server::HttpResponse& response, std::chrono::seconds ttl);

/**
 * Set (or replace) a header on a response, matching names case-insensitively
 */
void set_header(server::HttpResponse& response, std::string_view name, std::string value);

} // namespace oddsgate::proxy

#endif // ODDSGATE_PROXY_HEADER_POLICY_HPP
