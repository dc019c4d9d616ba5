#include "api/WsSession.hpp"

#include <utility>

#include <boost/asio/post.hpp>

#include "common/Log.hpp"
#include "common/Metrics.hpp"

namespace pulse::api {

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;

WsSession::WsSession(net::ip::tcp::socket&& socket, broadcast::SubscriberRegistry& registry)
    : ws_(std::move(socket)), registry_(registry), id_(broadcast::SubscriberRegistry::nextId()) {}

WsSession::~WsSession() { LOG_DEBUG("ws session destroyed id=" << id_); }

void WsSession::run(HttpRequest request) {
    ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
    ws_.set_option(websocket::stream_base::decorator([](websocket::response_type& res) {
        res.set(beast::http::field::server, "pulse-producer");
    }));
    ws_.binary(true);
    ws_.async_accept(request, beast::bind_front_handler(&WsSession::onAccept_, shared_from_this()));
}

void WsSession::onAccept_(beast::error_code ec) {
    if (ec) {
        fail_(ec, "accept");
        return;
    }
    open_.store(true);
    registry_.add(shared_from_this());
    metrics::Registry::instance().incrementCounter("ws.connections_total");
    doRead_();
}

// Inbound messages are drained and ignored; the read keeps close frames flowing.
void WsSession::doRead_() {
    ws_.async_read(buffer_, beast::bind_front_handler(&WsSession::onRead_, shared_from_this()));
}

void WsSession::onRead_(beast::error_code ec, std::size_t) {
    if (ec) {
        fail_(ec, "read");
        return;
    }
    buffer_.consume(buffer_.size());
    doRead_();
}

bool WsSession::ready() const noexcept { return open_.load() && !writing_.load(); }

void WsSession::send(const broadcast::Frame& frame) {
    if (!frame || !open_.load()) {
        return;
    }
    bool expected = false;
    if (!writing_.compare_exchange_strong(expected, true)) {
        return;
    }
    net::post(ws_.get_executor(), [self = shared_from_this(), frame]() { self->doWrite_(frame); });
}

void WsSession::doWrite_(broadcast::Frame frame) {
    if (!open_.load()) {
        writing_.store(false);
        return;
    }
    const auto* data = frame->data();
    const auto size = frame->size();
    ws_.async_write(net::buffer(data, size),
                    [self = shared_from_this(), frame = std::move(frame)](beast::error_code ec, std::size_t bytes) {
                        self->onWrite_(ec, bytes);
                    });
}

void WsSession::onWrite_(beast::error_code ec, std::size_t) {
    writing_.store(false);
    if (ec) {
        fail_(ec, "write");
    }
}

void WsSession::close() {
    net::post(ws_.get_executor(), [self = shared_from_this()]() {
        beast::error_code ec;
        beast::get_lowest_layer(self->ws_).socket().shutdown(net::ip::tcp::socket::shutdown_both, ec);
        beast::get_lowest_layer(self->ws_).socket().close(ec);
    });
    if (open_.exchange(false)) {
        registry_.remove(id_);
    }
}

void WsSession::fail_(beast::error_code ec, const char* what) {
    if (ec != websocket::error::closed && ec != net::error::operation_aborted && ec != net::error::eof) {
        LOG_WARN("ws session " << what << " failed id=" << id_ << " error=" << ec.message());
    }
    if (open_.exchange(false)) {
        registry_.remove(id_);
    }
}

}  // namespace pulse::api
