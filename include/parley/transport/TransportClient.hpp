/**
 * TransportClient.hpp - Supervised duplex connection to the assistant server
 *
 * One connection per session. A supervisor thread opens the connection, reads
 * frames and reconnects with linear backoff after unexpected drops. A heartbeat
 * thread pings the server and drops connections that stop answering.
 *
 * Callbacks fire on the supervisor thread; they must not block.
 */

#pragma once

#include "parley/Config.hpp"
#include "parley/Types.hpp"
#include "parley/transport/Connection.hpp"
#include "parley/transport/Protocol.hpp"

#include <functional>
#include <memory>
#include <string>

namespace parley::transport {

enum class ConnectionState {
    Disconnected,
    Connecting,
    Connected,
    Reconnecting,
    Failed  // Retry budget exhausted
};

const char* toString(ConnectionState state);

struct TransportCallbacks {
    std::function<void(const ServerMessage& message)> onMessage;
    std::function<void()> onConnected;
    std::function<void(ConnectionState state)> onStateChange;

    /**
     * `fatal` is true only when reconnection gave up.
     */
    std::function<void(const Error& error, bool fatal)> onError;
};

class TransportClient {
public:
    TransportClient(ConnectionFactory factory, std::string url, const TransportConfig& config = TransportConfig{});
    ~TransportClient();

    TransportClient(const TransportClient&) = delete;
    TransportClient& operator=(const TransportClient&) = delete;

    void setCallbacks(TransportCallbacks callbacks);

    /**
     * Start the supervisor. Returns immediately; use waitForConnection() to block.
     */
    void connect();
    void disconnect();

    bool waitForConnection(int timeout_ms);

    ConnectionState state() const;
    bool isConnected() const;
    int reconnectAttempts() const;
    std::string lastError() const;

    /**
     * Require an open connection. Return false with `error` set otherwise.
     */
    bool sendText(const std::string& content, std::string& error);
    bool sendClear(std::string& error);

    // Best effort, failures are logged
    void sendInterrupt();
    void sendPing();

    std::string sessionId() const;

    /**
     * Generate a fresh session id. Returns it.
     */
    std::string newSession();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace parley::transport
