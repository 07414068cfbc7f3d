/**
 * ODDSGATE - Caching Odds API Gateway
 * HTTP messages exchanged between the listener and the router
 */

#ifndef ODDSGATE_SERVER_HTTP_MESSAGE_HPP
#define ODDSGATE_SERVER_HTTP_MESSAGE_HPP

#include <boost/beast/http/status.hpp>
#include <boost/beast/http/verb.hpp>

#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace oddsgate::server {

namespace http = boost::beast::http;

/**
 * The parts of an inbound request the router looks at
 */
struct HttpRequest {
    http::verb method{http::verb::unknown};
    std::string target;        // Path plus query, as sent
    std::string x_request_id;  // Empty when the client sent none
    std::string client_ip;
};

struct HttpResponse {
    http::status status{http::status::ok};
    std::string content_type{"text/plain"};
    std::string body;
    std::vector<std::pair<std::string, std::string>> headers{};
};

using RequestHandler = std::function<HttpResponse(const HttpRequest&)>;

} // namespace oddsgate::server

#endif // ODDSGATE_SERVER_HTTP_MESSAGE_HPP
