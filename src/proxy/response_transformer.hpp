/**
 * ODDSGATE - Caching Odds API Gateway
 * Response Transformer - Restricts upstream odds payloads to allowed bookmakers
 *
 * Only 2xx payloads are touched. Field order of upstream objects is preserved
 * (nlohmann::ordered_json), and output is serialized compactly.
 */

#ifndef ODDSGATE_PROXY_RESPONSE_TRANSFORMER_HPP
#define ODDSGATE_PROXY_RESPONSE_TRANSFORMER_HPP

#include "proxy/query_params.hpp"

#include <nlohmann/json.hpp>

#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace oddsgate::proxy {

using json = nlohmann::ordered_json;

/**
 * Upstream 2xx payload with an unusable shape
 */
class MalformedPayloadError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * Set of bookmaker titles permitted in filtered output
 */
class BookmakerAllowList {
public:
    BookmakerAllowList() = default;
    explicit BookmakerAllowList(const std::vector<std::string>& titles);

    bool contains(std::string_view title) const;

    std::size_t size() const { return titles_.size(); }

    /**
     * DraftKings, FanDuel, BetMGM, Caesars, BetRivers, Resorts World Bet
     */
    static BookmakerAllowList defaults();

private:
    std::unordered_set<std::string> titles_;
};

/**
 * Response transformer
 */
class ResponseTransformer {
public:
    explicit ResponseTransformer(BookmakerAllowList allow_list);

    /**
     * Transform an upstream body for the given endpoint
     *
     * Non-2xx: body returned unchanged.
     * 2xx Collection: events keep only allowed bookmakers; events left with
     *   none are dropped; a non-array payload yields "[]".
     * 2xx Single: the event keeps only allowed bookmakers (possibly none) and
     *   is returned as a one-element array.
     *
     * @throws nlohmann::json::parse_error if a 2xx body is not JSON
     * @throws MalformedPayloadError if a 2xx single-event body is not an object
     */
    std::string transform(int status_code, const std::string& body, EndpointKind kind) const;

    /**
     * Filter one event's bookmakers in place; a missing or non-array
     * "bookmakers" becomes an empty array. Returns the remaining count.
     */
    std::size_t filter_event(json& event) const;

private:
    json transform_collection(json payload) const;
    json transform_single(json payload) const;

    BookmakerAllowList allow_list_;
};

/**
 * True for statuses in [200, 300)
 */
constexpr bool is_success_status(int status_code) {
    return status_code >= 200 && status_code < 300;
}

} // namespace oddsgate::proxy

#endif // ODDSGATE_PROXY_RESPONSE_TRANSFORMER_HPP
