/**
 * WebSocketConnection.hpp - Connection over a plain WebSocket (Boost.Beast)
 *
 * Accepts ws://host[:port][/path]. TLS (wss://) is not supported.
 */

#pragma once

#include "parley/transport/Connection.hpp"

#include <memory>

namespace parley::transport {

class WebSocketConnection : public Connection {
public:
    explicit WebSocketConnection(int connect_timeout_ms = 5000);
    ~WebSocketConnection() override;

    WebSocketConnection(const WebSocketConnection&) = delete;
    WebSocketConnection& operator=(const WebSocketConnection&) = delete;

    bool open(const std::string& url, std::string& error) override;
    bool send(const std::string& text, std::string& error) override;
    bool receive(std::string& text, std::string& error) override;
    void close() override;

    struct Endpoint {
        std::string host;
        std::string port;
        std::string target;
    };

    static bool parseUrl(const std::string& url, Endpoint& endpoint, std::string& error);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace parley::transport
