/**
 * WebSocketConnection.cpp - Connection over a plain WebSocket (Boost.Beast)
 *
 * Synchronous reads on the supervisor thread, writes from any thread under a
 * mutex. close() shuts the socket down so a blocked read returns.
 */

#include "parley/transport/WebSocketConnection.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include <atomic>
#include <chrono>
#include <iostream>
#include <mutex>

namespace parley::transport {

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = net::ip::tcp;

struct WebSocketConnection::Impl {
    net::io_context ioc;
    websocket::stream<beast::tcp_stream> ws{ioc};
    std::mutex write_mutex;
    std::atomic<bool> connected{false};
    int connect_timeout_ms;

    explicit Impl(int timeout_ms) : connect_timeout_ms(timeout_ms) {}

    bool connect(const tcp::resolver::results_type& results, std::string& error) {
        beast::error_code ec;
        auto& stream = beast::get_lowest_layer(ws);

        // Async connect so the timeout applies; run the context until it completes
        stream.expires_after(std::chrono::milliseconds(connect_timeout_ms));
        stream.async_connect(results, [&ec](beast::error_code e, const tcp::endpoint&) { ec = e; });
        ioc.restart();
        ioc.run();
        stream.expires_never();

        if (ec) {
            error = "connect failed: " + ec.message();
            return false;
        }
        return true;
    }
};

WebSocketConnection::WebSocketConnection(int connect_timeout_ms)
    : impl_(std::make_unique<Impl>(connect_timeout_ms)) {
}

WebSocketConnection::~WebSocketConnection() {
    close();
}

bool WebSocketConnection::parseUrl(const std::string& url, Endpoint& endpoint, std::string& error) {
    const std::string scheme = "ws://";
    if (url.rfind("wss://", 0) == 0) {
        error = "wss:// is not supported, use ws://";
        return false;
    }
    if (url.rfind(scheme, 0) != 0) {
        error = "URL must start with ws://: " + url;
        return false;
    }

    const std::string rest = url.substr(scheme.size());
    const size_t slash = rest.find('/');
    const std::string authority = rest.substr(0, slash);
    endpoint.target = slash == std::string::npos ? "/" : rest.substr(slash);

    const size_t colon = authority.rfind(':');
    if (colon == std::string::npos) {
        endpoint.host = authority;
        endpoint.port = "80";
    } else {
        endpoint.host = authority.substr(0, colon);
        endpoint.port = authority.substr(colon + 1);
    }

    if (endpoint.host.empty() || endpoint.port.empty()) {
        error = "invalid host in URL: " + url;
        return false;
    }
    return true;
}

bool WebSocketConnection::open(const std::string& url, std::string& error) {
    Endpoint endpoint;
    if (!parseUrl(url, endpoint, error)) {
        return false;
    }

    beast::error_code ec;
    tcp::resolver resolver(impl_->ioc);
    auto results = resolver.resolve(endpoint.host, endpoint.port, ec);
    if (ec) {
        error = "resolve failed: " + ec.message();
        return false;
    }

    if (!impl_->connect(results, error)) {
        return false;
    }

    impl_->ws.set_option(websocket::stream_base::decorator(
        [](websocket::request_type& req) {
            req.set(beast::http::field::user_agent, "parley");
        }));

    impl_->ws.handshake(endpoint.host + ":" + endpoint.port, endpoint.target, ec);
    if (ec) {
        error = "handshake failed: " + ec.message();
        beast::get_lowest_layer(impl_->ws).close();
        return false;
    }

    impl_->ws.text(true);
    impl_->connected = true;
    return true;
}

bool WebSocketConnection::send(const std::string& text, std::string& error) {
    if (!impl_->connected) {
        error = "not connected";
        return false;
    }

    std::lock_guard<std::mutex> lock(impl_->write_mutex);
    beast::error_code ec;
    impl_->ws.write(net::buffer(text), ec);
    if (ec) {
        error = "send failed: " + ec.message();
        return false;
    }
    return true;
}

bool WebSocketConnection::receive(std::string& text, std::string& error) {
    if (!impl_->connected) {
        error = "not connected";
        return false;
    }

    beast::flat_buffer buffer;
    beast::error_code ec;
    impl_->ws.read(buffer, ec);
    if (ec) {
        impl_->connected = false;
        error = ec == websocket::error::closed ? "closed by server" : "receive failed: " + ec.message();
        return false;
    }

    text = beast::buffers_to_string(buffer.data());
    return true;
}

void WebSocketConnection::close() {
    if (!impl_->connected.exchange(false)) {
        return;
    }
    beast::error_code ec;
    auto& socket = beast::get_lowest_layer(impl_->ws).socket();
    socket.shutdown(tcp::socket::shutdown_both, ec);
}

} // namespace parley::transport
