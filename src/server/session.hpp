/**
 * ODDSGATE - Caching Odds API Gateway
 * HTTP session - one accepted client socket, served with Boost.Beast
 */

#ifndef ODDSGATE_SERVER_SESSION_HPP
#define ODDSGATE_SERVER_SESSION_HPP

#include "server/http_message.hpp"

#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <memory>
#include <string>
#include <string_view>

namespace oddsgate::server {

namespace beast = boost::beast;
using tcp = boost::asio::ip::tcp;

/**
 * Reads HTTP/1.x requests off one socket, hands each to the router and
 * writes the reply back. Keep-alive is honoured; 30 s of silence closes.
 *
 * Replies produced here rather than by the router:
 *   400  request line or headers could not be parsed
 *   505  version other than HTTP/1.0 or HTTP/1.1
 *   500  the handler threw
 */
class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
    HttpSession(tcp::socket socket, RequestHandler handler);
    ~HttpSession();

    HttpSession(const HttpSession&) = delete;
    HttpSession& operator=(const HttpSession&) = delete;

    void run();

private:
    using Reply = http::response<http::string_body>;

    void read_next();
    void on_read(beast::error_code ec, std::size_t bytes);
    Reply answer();
    Reply error_reply(http::status status, std::string_view message) const;
    void send(Reply reply, bool keep_alive);
    void on_sent(bool keep_alive, beast::error_code ec, std::size_t bytes);
    void close();

    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    http::request<http::string_body> request_;
    Reply reply_;
    RequestHandler handler_;
    std::string peer_ip_;
};

} // namespace oddsgate::server

#endif // ODDSGATE_SERVER_SESSION_HPP
