#pragma once

#include <atomic>
#include <cstdint>
#include <memory>

#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

#include "broadcast/SubscriberRegistry.hpp"

namespace pulse::api {

// Live WebSocket subscriber. Receives encoded batches as binary frames; at
// most one write is in flight and frames arriving meanwhile are skipped.
class WsSession : public broadcast::Subscriber, public std::enable_shared_from_this<WsSession> {
public:
    using HttpRequest = boost::beast::http::request<boost::beast::http::string_body>;

    WsSession(boost::asio::ip::tcp::socket&& socket, broadcast::SubscriberRegistry& registry);
    ~WsSession() override;

    // Completes the upgrade handshake for an already-read request.
    void run(HttpRequest request);

    // Closes the socket from any thread.
    void close();

    std::uint64_t id() const noexcept override { return id_; }
    bool ready() const noexcept override;
    void send(const broadcast::Frame& frame) override;

private:
    void onAccept_(boost::beast::error_code ec);
    void doRead_();
    void onRead_(boost::beast::error_code ec, std::size_t bytes);
    void doWrite_(broadcast::Frame frame);
    void onWrite_(boost::beast::error_code ec, std::size_t bytes);
    void fail_(boost::beast::error_code ec, const char* what);

    boost::beast::websocket::stream<boost::beast::tcp_stream> ws_;
    boost::beast::flat_buffer buffer_;
    broadcast::SubscriberRegistry& registry_;
    const std::uint64_t id_;
    std::atomic<bool> open_{false};
    std::atomic<bool> writing_{false};
};

}  // namespace pulse::api
