/**
 * ODDSGATE - Caching Odds API Gateway
 * Cache Key Implementation
 */

#include "cache/cache_key.hpp"

#include <xxhash.h>

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace oddsgate::cache {

namespace {

// Keep '=' and '&' unambiguous inside names and values
std::string encode_component(std::string_view value) {
    std::ostringstream oss;
    oss << std::hex << std::uppercase << std::setfill('0');
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' || c == ',') {
            oss << static_cast<char>(c);
        } else {
            oss << '%' << std::setw(2) << static_cast<int>(c);
        }
    }
    return oss.str();
}

} // anonymous namespace

bool is_credential_param(std::string_view name) {
    static constexpr std::string_view credential = "apikey";
    if (name.size() != credential.size()) {
        return false;
    }
    return std::equal(name.begin(), name.end(), credential.begin(),
                      [](char a, char b) {
                          return std::tolower(static_cast<unsigned char>(a)) == b;
                      });
}

CacheKey derive_cache_key(std::string_view resource_path, const ParamList& params) {
    ParamList canonical;
    canonical.reserve(params.size());
    for (const auto& param : params) {
        if (!is_credential_param(param.first)) {
            canonical.push_back(param);
        }
    }

    std::stable_sort(canonical.begin(), canonical.end(),
                     [](const auto& a, const auto& b) { return a.first < b.first; });

    std::string text(resource_path);
    text.push_back('?');
    bool first = true;
    for (const auto& [name, value] : canonical) {
        if (!first) {
            text.push_back('&');
        }
        first = false;
        text += encode_component(name);
        text.push_back('=');
        text += encode_component(value);
    }

    CacheKey key;
    key.hash = XXH64(text.data(), text.size(), 0);
    key.text = std::move(text);
    return key;
}

} // namespace oddsgate::cache
