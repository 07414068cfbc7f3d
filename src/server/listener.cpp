/**
 * ODDSGATE - Caching Odds API Gateway
 * Listener implementation
 */

#include "server/listener.hpp"
#include "server/session.hpp"

#include <boost/asio/strand.hpp>
#include <spdlog/spdlog.h>

#include <csignal>
#include <memory>
#include <stdexcept>

namespace oddsgate::server {

namespace asio = boost::asio;

Listener::Listener(ListenerConfig config)
    : config_(std::move(config))
    , io_context_(static_cast<int>(config_.threads))
    , work_guard_(asio::make_work_guard(io_context_))
    , acceptor_(io_context_)
    , signals_(io_context_)
{
}

Listener::~Listener() {
    stop();
    wait();
}

void Listener::start(RequestHandler handler) {
    handler_ = std::move(handler);
    bind();

    if (config_.stop_on_signal) {
        signals_.add(SIGINT);
        signals_.add(SIGTERM);
        signals_.async_wait([this](boost::system::error_code ec, int signal) {
            if (!ec) {
                spdlog::info("Listener: signal {} received, shutting down", signal);
                stop();
            }
        });
    }

    accept_next();

    for (std::size_t i = 0; i < config_.threads; ++i) {
        workers_.emplace_back([this](std::stop_token stop) { work(stop); });
    }
    spdlog::info("Listener: serving on {}:{} with {} threads",
                 config_.bind_address, port_, config_.threads);
}

void Listener::bind() {
    boost::system::error_code ec;
    auto address = asio::ip::make_address(config_.bind_address, ec);
    if (ec) {
        throw std::runtime_error("Invalid bind address '" + config_.bind_address + "': " + ec.message());
    }
    tcp::endpoint endpoint(address, config_.port);

    acceptor_.open(endpoint.protocol(), ec);
    if (!ec) {
        acceptor_.set_option(tcp::acceptor::reuse_address(true), ec);
    }
    if (!ec) {
        acceptor_.bind(endpoint, ec);
    }
    if (!ec) {
        acceptor_.listen(asio::socket_base::max_listen_connections, ec);
    }
    if (ec) {
        throw std::runtime_error("Cannot listen on " + config_.bind_address + ":" +
                                 std::to_string(config_.port) + ": " + ec.message());
    }

    port_ = acceptor_.local_endpoint().port();
}

void Listener::accept_next() {
    acceptor_.async_accept(
        asio::make_strand(io_context_),
        [this](boost::system::error_code ec, tcp::socket socket) {
            if (ec == asio::error::operation_aborted || !acceptor_.is_open()) {
                return;
            }
            if (ec) {
                spdlog::warn("Listener: accept failed: {}", ec.message());
            } else {
                std::make_shared<HttpSession>(std::move(socket), handler_)->run();
            }
            accept_next();
        });
}

void Listener::work(std::stop_token stop) {
    while (!stop.stop_requested()) {
        try {
            io_context_.run();
            return;
        } catch (const std::exception& e) {
            spdlog::error("Listener: worker caught {}", e.what());
        }
    }
}

void Listener::stop() {
    std::call_once(stopped_, [this] {
        boost::system::error_code ec;
        acceptor_.close(ec);
        signals_.cancel(ec);
        work_guard_.reset();
        for (auto& worker : workers_) {
            worker.request_stop();
        }
        io_context_.stop();
    });
}

void Listener::wait() {
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

} // namespace oddsgate::server
