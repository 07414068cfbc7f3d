/**
 * ODDSGATE - Caching Odds API Gateway
 * Header Policy implementation
 */

#include "proxy/header_policy.hpp"

#include <boost/beast/core/string.hpp>

namespace oddsgate::proxy {

std::string cache_control_value(std::chrono::seconds ttl) {
    auto seconds = ttl.count();
    // Half rounded up, e.g. 15 -> 8
    auto stale = (seconds + 1) / 2;
    return "s-maxage=" + std::to_string(seconds) +
           ", stale-while-revalidate=" + std::to_string(stale);
}

void set_header(server::HttpResponse& response, std::string_view name, std::string value) {
    for (auto& [existing_name, existing_value] : response.headers) {
        if (boost::beast::iequals(existing_name, boost::beast::string_view(name.data(), name.size()))) {
            existing_value = std::move(value);
            return;
        }
    }
    response.headers.emplace_back(std::string(name), std::move(value));
}

void apply_cache_headers(server::HttpResponse& response, std::chrono::seconds ttl) {
    set_header(response, "Cache-Control", cache_control_value(ttl));
    response.content_type = std::string(kJsonContentType);
    set_header(response, "Access-Control-Allow-Origin", "*");
}

} // namespace oddsgate::proxy
