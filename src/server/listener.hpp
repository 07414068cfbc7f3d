/**
 * ODDSGATE - Caching Odds API Gateway
 * Listener - accepts client connections and runs the I/O worker pool
 */

#ifndef ODDSGATE_SERVER_LISTENER_HPP
#define ODDSGATE_SERVER_LISTENER_HPP

#include "server/http_message.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/signal_set.hpp>

#include <cstdint>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

namespace oddsgate::server {

struct ListenerConfig {
    std::string bind_address{"0.0.0.0"};
    std::uint16_t port{8080};        // 0 picks an ephemeral port
    std::size_t threads{1};
    bool stop_on_signal{true};       // SIGINT and SIGTERM call stop()
};

/**
 * Owns the io_context shared by the acceptor and every HttpSession.
 * start() binds and returns; wait() blocks until stop() has run and the
 * workers have drained.
 */
class Listener {
public:
    explicit Listener(ListenerConfig config);
    ~Listener();

    Listener(const Listener&) = delete;
    Listener& operator=(const Listener&) = delete;

    /**
     * Bind, listen and spawn the workers
     * @throws std::runtime_error if the address is invalid or the bind fails
     */
    void start(RequestHandler handler);

    void stop();
    void wait();

    /**
     * Port actually bound; differs from the configured one when that was 0
     */
    std::uint16_t port() const { return port_; }

private:
    void bind();
    void accept_next();
    void work(std::stop_token stop);

    using WorkGuard = boost::asio::executor_work_guard<boost::asio::io_context::executor_type>;

    ListenerConfig config_;
    boost::asio::io_context io_context_;
    WorkGuard work_guard_;
    boost::asio::ip::tcp::acceptor acceptor_;
    boost::asio::signal_set signals_;
    RequestHandler handler_;
    std::uint16_t port_{0};
    std::once_flag stopped_;
    std::vector<std::jthread> workers_;
};

} // namespace oddsgate::server

#endif // ODDSGATE_SERVER_LISTENER_HPP
