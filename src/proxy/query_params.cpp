/**
 * ODDSGATE - Caching Odds API Gateway
 * Query Parameters implementation
 */

#include "proxy/query_params.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <limits>

namespace oddsgate::proxy {

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string trim(std::string_view value) {
    auto start = value.find_first_not_of(" \t");
    if (start == std::string_view::npos) {
        return {};
    }
    auto end = value.find_last_not_of(" \t");
    return std::string(value.substr(start, end - start + 1));
}

} // anonymous namespace

std::optional<std::string> QueryParams::get(std::string_view name) const {
    for (const auto& [key, value] : params) {
        if (key == name) {
            return value;
        }
    }
    return std::nullopt;
}

std::string QueryParams::get_or(std::string_view name, std::string_view fallback) const {
    auto value = get(name);
    if (!value || value->empty()) {
        return std::string(fallback);
    }
    return *value;
}

std::string url_decode(std::string_view value) {
    std::string result;
    result.reserve(value.size());

    for (std::size_t i = 0; i < value.size(); ++i) {
        char c = value[i];
        if (c == '+') {
            result.push_back(' ');
        } else if (c == '%' && i + 2 < value.size()) {
            int hi = hex_value(value[i + 1]);
            int lo = hex_value(value[i + 2]);
            if (hi < 0 || lo < 0) {
                result.push_back(c);
                continue;
            }
            result.push_back(static_cast<char>(hi * 16 + lo));
            i += 2;
        } else {
            result.push_back(c);
        }
    }

    return result;
}

QueryParams parse_query(std::string_view target) {
    QueryParams result;

    auto question = target.find('?');
    result.path = std::string(target.substr(0, question));
    if (question == std::string_view::npos) {
        return result;
    }

    std::string_view query = target.substr(question + 1);
    auto fragment = query.find('#');
    if (fragment != std::string_view::npos) {
        query = query.substr(0, fragment);
    }

    while (!query.empty()) {
        auto amp = query.find('&');
        std::string_view pair = query.substr(0, amp);
        query = amp == std::string_view::npos ? std::string_view{} : query.substr(amp + 1);

        if (pair.empty()) {
            continue;
        }

        auto eq = pair.find('=');
        std::string name = url_decode(pair.substr(0, eq));
        std::string value = eq == std::string_view::npos ? std::string{} : url_decode(pair.substr(eq + 1));
        if (name.empty()) {
            continue;
        }
        result.params.emplace_back(std::move(name), std::move(value));
    }

    return result;
}

cache::ParamList OddsQuery::key_params() const {
    return {
        {"sport", sport},
        {"regions", regions},
        {"markets", markets},
        {"oddsFormat", odds_format},
    };
}

OddsQuery make_odds_query(const QueryParams& query, EndpointKind kind) {
    OddsQuery odds;
    odds.sport = query.get_or("sport", defaults::Sport);
    odds.regions = query.get_or("regions", defaults::Regions);
    odds.markets = query.get_or("markets",
        kind == EndpointKind::Collection ? defaults::CollectionMarkets : defaults::EventMarkets);
    odds.odds_format = query.get_or("oddsFormat", defaults::OddsFormat);
    odds.ttl = query.get("ttl");
    return odds;
}

TtlPolicy::TtlPolicy(std::chrono::seconds default_ttl, std::chrono::seconds min_ttl,
                     std::chrono::seconds error_ttl)
    : default_ttl_(default_ttl)
    , min_ttl_(min_ttl)
    , error_ttl_(error_ttl)
{
}

std::chrono::seconds TtlPolicy::effective_ttl(const std::optional<std::string>& raw) const {
    if (!raw) {
        return std::max(default_ttl_, min_ttl_);
    }

    std::string value = trim(*raw);
    if (value.empty()) {
        return std::max(default_ttl_, min_ttl_);
    }

    // Whole string must parse as a finite number
    char* end = nullptr;
    double parsed = std::strtod(value.c_str(), &end);
    if (end != value.c_str() + value.size() || !std::isfinite(parsed)) {
        return std::max(default_ttl_, min_ttl_);
    }

    double truncated = std::trunc(parsed);
    if (truncated <= 0.0) {
        return std::max(default_ttl_, min_ttl_);
    }

    // Clamp before the integer cast
    constexpr double max_seconds = static_cast<double>(std::numeric_limits<std::int32_t>::max());
    auto seconds = std::chrono::seconds(static_cast<std::int64_t>(std::min(truncated, max_seconds)));
    return std::max(seconds, min_ttl_);
}

} // namespace oddsgate::proxy
