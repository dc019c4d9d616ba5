#pragma once

#include <atomic>
#include <cstdint>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/error.hpp>

#include "api/Router.hpp"
#include "broadcast/SubscriberRegistry.hpp"

namespace pulse::api {

struct Endpoint {
    std::string address;
    std::uint16_t port;
};

// Serves the HTTP routes and upgrades WebSocket requests on any path into
// live subscribers. All I/O runs on threadCount io_context threads.
class HttpServer {
public:
    struct CorsConfig {
        bool enabled{false};
        std::string origin;
    };

    HttpServer(Endpoint endpoint,
               std::size_t threadCount,
               const Router& router,
               broadcast::SubscriberRegistry& subscribers);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    // Throws std::runtime_error when the listener cannot be opened.
    void start();
    void stop();
    void wait();

    void setCorsConfig(CorsConfig config);

    // Bound port, useful when started on port 0.
    std::uint16_t port() const noexcept { return boundPort_.load(); }

private:
    void doAccept_();
    void onAccept_(boost::beast::error_code ec, boost::asio::ip::tcp::socket socket);

    Endpoint endpoint_;
    std::size_t threadCount_;
    const Router& router_;
    broadcast::SubscriberRegistry& subscribers_;
    CorsConfig corsConfig_{};

    boost::asio::io_context ioContext_;
    boost::asio::ip::tcp::acceptor acceptor_;
    std::vector<std::thread> threads_;
    std::atomic<bool> running_{false};
    std::atomic<std::uint16_t> boundPort_{0};
};

}  // namespace pulse::api
