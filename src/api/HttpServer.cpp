#include "api/HttpServer.hpp"

#include <chrono>
#include <memory>
#include <stdexcept>
#include <utility>

#include <boost/asio/dispatch.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

#include "api/WsSession.hpp"
#include "common/Log.hpp"

namespace pulse::api {

namespace beast = boost::beast;
namespace bhttp = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace {

std::string formatAddress(const Endpoint& endpoint) {
    if (endpoint.address.empty()) {
        return std::string("0.0.0.0:") + std::to_string(endpoint.port);
    }
    return endpoint.address + ':' + std::to_string(endpoint.port);
}

// One HTTP connection. Hands the socket to a WsSession on upgrade.
class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
    HttpSession(tcp::socket&& socket,
                const Router& router,
                broadcast::SubscriberRegistry& subscribers,
                const HttpServer::CorsConfig& cors)
        : stream_(std::move(socket)), router_(router), subscribers_(subscribers), cors_(cors) {}

    void run() {
        net::dispatch(stream_.get_executor(), beast::bind_front_handler(&HttpSession::doRead, shared_from_this()));
    }

private:
    void doRead() {
        request_ = {};
        stream_.expires_after(std::chrono::seconds(30));
        bhttp::async_read(stream_, buffer_, request_, beast::bind_front_handler(&HttpSession::onRead, shared_from_this()));
    }

    void onRead(beast::error_code ec, std::size_t) {
        if (ec == bhttp::error::end_of_stream) {
            closeSocket();
            return;
        }
        if (ec) {
            if (ec != net::error::operation_aborted && ec != beast::error::timeout) {
                LOG_DEBUG("http read failed error=" << ec.message());
            }
            return;
        }

        if (websocket::is_upgrade(request_)) {
            stream_.expires_never();
            std::make_shared<WsSession>(stream_.release_socket(), subscribers_)->run(std::move(request_));
            return;
        }

        buildResponse();
        bhttp::async_write(stream_, response_, beast::bind_front_handler(&HttpSession::onWrite, shared_from_this()));
    }

    void buildResponse() {
        const std::string target(request_.target());

        Request apiRequest;
        apiRequest.method = std::string(request_.method_string());
        apiRequest.target = target;
        const auto queryPos = target.find('?');
        if (queryPos != std::string::npos) {
            apiRequest.path = target.substr(0, queryPos);
            apiRequest.query = target.substr(queryPos + 1);
        } else {
            apiRequest.path = target;
        }

        response_ = {};
        response_.version(request_.version());
        response_.keep_alive(request_.keep_alive());
        response_.set(bhttp::field::server, "pulse-producer");

        if (cors_.enabled && !cors_.origin.empty()) {
            response_.set(bhttp::field::access_control_allow_origin, cors_.origin);
            response_.set(bhttp::field::vary, "Origin");
            response_.set(bhttp::field::access_control_allow_headers, "Content-Type");
        }

        if (apiRequest.method == "OPTIONS" && cors_.enabled) {
            response_.result(bhttp::status::no_content);
            response_.set(bhttp::field::access_control_allow_methods, "GET, OPTIONS");
            response_.prepare_payload();
            return;
        }

        const auto data = router_.handle(apiRequest);
        response_.result(static_cast<unsigned>(data.statusCode));
        if (!data.contentType.empty()) {
            response_.set(bhttp::field::content_type, data.contentType);
        }
        for (const auto& header : data.headers) {
            if (!header.first.empty()) {
                response_.set(header.first, header.second);
            }
        }
        response_.body() = data.body;
        response_.prepare_payload();
    }

    void onWrite(beast::error_code ec, std::size_t) {
        if (ec) {
            LOG_DEBUG("http write failed error=" << ec.message());
            return;
        }
        if (!response_.keep_alive()) {
            closeSocket();
            return;
        }
        doRead();
    }

    void closeSocket() {
        beast::error_code ec;
        stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
    }

    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    bhttp::request<bhttp::string_body> request_;
    bhttp::response<bhttp::string_body> response_;
    const Router& router_;
    broadcast::SubscriberRegistry& subscribers_;
    const HttpServer::CorsConfig& cors_;
};

}  // namespace

HttpServer::HttpServer(Endpoint endpoint,
                       std::size_t threadCount,
                       const Router& router,
                       broadcast::SubscriberRegistry& subscribers)
    : endpoint_(std::move(endpoint)),
      threadCount_(threadCount ? threadCount : 1),
      router_(router),
      subscribers_(subscribers),
      ioContext_(static_cast<int>(threadCount ? threadCount : 1)),
      acceptor_(net::make_strand(ioContext_)) {}

HttpServer::~HttpServer() { stop(); }

void HttpServer::setCorsConfig(CorsConfig config) { corsConfig_ = std::move(config); }

void HttpServer::start() {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) {
        return;
    }

    beast::error_code ec;
    const auto address = net::ip::make_address(endpoint_.address.empty() ? "0.0.0.0" : endpoint_.address, ec);
    if (ec) {
        running_.store(false);
        throw std::runtime_error("invalid listen address: " + endpoint_.address);
    }
    const tcp::endpoint listenEndpoint{address, endpoint_.port};

    acceptor_.open(listenEndpoint.protocol(), ec);
    if (!ec) {
        acceptor_.set_option(net::socket_base::reuse_address(true), ec);
    }
    if (!ec) {
        acceptor_.bind(listenEndpoint, ec);
    }
    if (!ec) {
        acceptor_.listen(net::socket_base::max_listen_connections, ec);
    }
    if (ec) {
        beast::error_code closeEc;
        acceptor_.close(closeEc);
        running_.store(false);
        throw std::runtime_error("cannot listen on " + formatAddress(endpoint_) + ": " + ec.message());
    }
    boundPort_.store(acceptor_.local_endpoint().port());

    LOG_INFO("HTTP server listening on " << formatAddress(Endpoint{endpoint_.address, boundPort_.load()})
                                         << " threads=" << threadCount_);

    doAccept_();

    threads_.reserve(threadCount_);
    for (std::size_t i = 0; i < threadCount_; ++i) {
        threads_.emplace_back([this, i]() {
            LOG_DEBUG("Worker " << i << " started");
            ioContext_.run();
            LOG_DEBUG("Worker " << i << " finished");
        });
    }
}

void HttpServer::doAccept_() {
    acceptor_.async_accept(net::make_strand(ioContext_), beast::bind_front_handler(&HttpServer::onAccept_, this));
}

void HttpServer::onAccept_(beast::error_code ec, tcp::socket socket) {
    if (ec) {
        if (ec == net::error::operation_aborted || !running_.load()) {
            return;
        }
        LOG_WARN("accept failed error=" << ec.message());
    } else {
        std::make_shared<HttpSession>(std::move(socket), router_, subscribers_, corsConfig_)->run();
    }
    if (running_.load()) {
        doAccept_();
    }
}

void HttpServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    net::post(acceptor_.get_executor(), [this]() {
        beast::error_code ec;
        acceptor_.close(ec);
    });

    for (const auto& subscriber : subscribers_.snapshot()) {
        if (auto session = std::dynamic_pointer_cast<WsSession>(subscriber)) {
            session->close();
        }
    }

    ioContext_.stop();
    wait();
    LOG_INFO("HTTP server stopped");
}

void HttpServer::wait() {
    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    threads_.clear();
}

}  // namespace pulse::api
