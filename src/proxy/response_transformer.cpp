/**
 * ODDSGATE - Caching Odds API Gateway
 * Response Transformer implementation
 */

#include "proxy/response_transformer.hpp"

#include <spdlog/spdlog.h>

#include <utility>

namespace oddsgate::proxy {

namespace {

std::string serialize(const json& value) {
    // Replace invalid UTF-8 rather than failing the whole response
    return value.dump(-1, ' ', false, json::error_handler_t::replace);
}

} // anonymous namespace

BookmakerAllowList::BookmakerAllowList(const std::vector<std::string>& titles)
    : titles_(titles.begin(), titles.end())
{
}

bool BookmakerAllowList::contains(std::string_view title) const {
    return titles_.find(std::string(title)) != titles_.end();
}

BookmakerAllowList BookmakerAllowList::defaults() {
    return BookmakerAllowList({
        "DraftKings",
        "FanDuel",
        "BetMGM",
        "Caesars",
        "BetRivers",
        "Resorts World Bet",
    });
}

ResponseTransformer::ResponseTransformer(BookmakerAllowList allow_list)
    : allow_list_(std::move(allow_list))
{
    spdlog::debug("Response transformer: {} allowed bookmakers", allow_list_.size());
}

std::string ResponseTransformer::transform(int status_code, const std::string& body,
                                           EndpointKind kind) const
{
    if (!is_success_status(status_code)) {
        return body;
    }

    json payload = json::parse(body);

    if (kind == EndpointKind::Collection) {
        return serialize(transform_collection(std::move(payload)));
    }
    return serialize(transform_single(std::move(payload)));
}

std::size_t ResponseTransformer::filter_event(json& event) const {
    json kept = json::array();

    auto it = event.find("bookmakers");
    if (it != event.end() && it->is_array()) {
        for (auto& bookmaker : *it) {
            if (!bookmaker.is_object()) {
                continue;
            }
            auto title = bookmaker.find("title");
            if (title != bookmaker.end() && title->is_string() &&
                allow_list_.contains(title->get_ref<const std::string&>())) {
                kept.push_back(std::move(bookmaker));
            }
        }
    }

    std::size_t count = kept.size();
    event["bookmakers"] = std::move(kept);
    return count;
}

json ResponseTransformer::transform_collection(json payload) const {
    json result = json::array();
    if (!payload.is_array()) {
        spdlog::warn("Response transformer: expected an array of events, got {}", payload.type_name());
        return result;
    }

    std::size_t dropped = 0;
    for (auto& event : payload) {
        if (!event.is_object()) {
            ++dropped;
            continue;
        }
        if (filter_event(event) == 0) {
            ++dropped;
            continue;
        }
        result.push_back(std::move(event));
    }

    spdlog::debug("Response transformer: kept {} of {} events", result.size(), payload.size());
    if (dropped > 0) {
        spdlog::trace("Response transformer: dropped {} events without allowed bookmakers", dropped);
    }
    return result;
}

json ResponseTransformer::transform_single(json payload) const {
    if (!payload.is_object()) {
        throw MalformedPayloadError(
            std::string("Expected a single event object, got ") + payload.type_name());
    }

    std::size_t kept = filter_event(payload);
    spdlog::debug("Response transformer: event keeps {} bookmakers", kept);

    json result = json::array();
    result.push_back(std::move(payload));
    return result;
}

} // namespace oddsgate::proxy
