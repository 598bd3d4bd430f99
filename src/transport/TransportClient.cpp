/**
 * TransportClient.cpp - Supervised duplex connection to the assistant server
 *
 * Reconnection: after a drop or a failed open the supervisor waits
 * attempt * reconnect_base_delay_ms and tries again, at most
 * max_reconnect_attempts times in a row. A successful open resets the count.
 */

#include "parley/transport/TransportClient.hpp"

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <chrono>
#include <condition_variable>
#include <iostream>
#include <mutex>
#include <thread>

namespace parley::transport {

using Clock = std::chrono::steady_clock;

namespace {

std::string generateSessionId() {
    static thread_local boost::uuids::random_generator generator;
    return boost::uuids::to_string(generator());
}

} // anonymous namespace

const char* toString(ConnectionState state) {
    switch (state) {
        case ConnectionState::Disconnected: return "disconnected";
        case ConnectionState::Connecting: return "connecting";
        case ConnectionState::Connected: return "connected";
        case ConnectionState::Reconnecting: return "reconnecting";
        case ConnectionState::Failed: return "failed";
    }
    return "unknown";
}

struct TransportClient::Impl {
    ConnectionFactory factory;
    std::string url;
    TransportConfig config;

    mutable std::mutex mutex;
    std::condition_variable cv;
    TransportCallbacks callbacks;

    std::shared_ptr<Connection> connection;
    ConnectionState state = ConnectionState::Disconnected;
    std::string session_id;
    std::string lastError;
    int attempts = 0;
    bool stopping = false;

    // Heartbeat bookkeeping
    Clock::time_point lastInbound;
    Clock::time_point pingSentAt;
    bool pingOutstanding = false;
    bool heartbeatTimedOut = false;

    std::thread supervisor;
    std::thread heartbeat;

    Impl(ConnectionFactory f, std::string u, const TransportConfig& cfg)
        : factory(std::move(f))
        , url(std::move(u))
        , config(cfg)
        , session_id(generateSessionId()) {}

    void setState(ConnectionState next) {
        std::function<void(ConnectionState)> notify;
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (state == next) return;
            state = next;
            notify = callbacks.onStateChange;
        }
        cv.notify_all();
        std::cout << "[TransportClient] " << toString(next) << std::endl;
        if (notify) notify(next);
    }

    void reportError(const std::string& message, bool fatal) {
        std::function<void(const Error&, bool)> notify;
        {
            std::lock_guard<std::mutex> lock(mutex);
            lastError = message;
            notify = callbacks.onError;
        }
        std::cerr << "[TransportClient] " << (fatal ? "Fatal: " : "") << message << std::endl;
        if (notify) notify(Error{ErrorKind::Transport, message}, fatal);
    }

    void readLoop(const std::shared_ptr<Connection>& conn) {
        std::string frame;
        std::string error;

        while (conn->receive(frame, error)) {
            std::function<void(const ServerMessage&)> onMessage;
            {
                std::lock_guard<std::mutex> lock(mutex);
                lastInbound = Clock::now();
                pingOutstanding = false;
                onMessage = callbacks.onMessage;
            }

            ServerMessage message;
            std::string decodeError;
            if (!protocol::decode(frame, message, decodeError)) {
                reportError("protocol: " + decodeError, false);
                continue;
            }
            if (message.type == ServerMessageType::Pong) {
                continue;
            }
            if (message.type == ServerMessageType::Unknown) {
                std::cout << "[TransportClient] Ignoring message type: " << message.raw_type << std::endl;
                continue;
            }
            if (onMessage) onMessage(message);
        }

        std::lock_guard<std::mutex> lock(mutex);
        if (!stopping) {
            lastError = heartbeatTimedOut ? "heartbeat timeout" : error;
        }
        heartbeatTimedOut = false;
    }

    // Returns false if stopping was requested during the wait
    bool waitFor(std::chrono::milliseconds delay) {
        std::unique_lock<std::mutex> lock(mutex);
        return !cv.wait_for(lock, delay, [this] { return stopping; });
    }

    void runSupervisor() {
        while (true) {
            int attempt;
            {
                std::lock_guard<std::mutex> lock(mutex);
                if (stopping) break;
                attempt = attempts;
            }
            setState(attempt == 0 ? ConnectionState::Connecting : ConnectionState::Reconnecting);

            std::shared_ptr<Connection> conn = factory();
            std::string error;
            bool opened = conn && conn->open(url, error);
            if (!conn) {
                error = "no connection available";
            }

            if (opened) {
                std::function<void()> onConnected;
                {
                    std::lock_guard<std::mutex> lock(mutex);
                    if (stopping) {
                        conn->close();
                        break;
                    }
                    connection = conn;
                    attempts = 0;
                    lastInbound = Clock::now();
                    pingOutstanding = false;
                    onConnected = callbacks.onConnected;
                }
                std::cout << "[TransportClient] Connected to " << url << std::endl;
                setState(ConnectionState::Connected);
                if (onConnected) onConnected();

                readLoop(conn);

                // Senders see the drop before the connection object goes away
                bool dropped;
                {
                    std::lock_guard<std::mutex> lock(mutex);
                    dropped = !stopping;
                }
                if (dropped) {
                    setState(ConnectionState::Reconnecting);
                }

                {
                    std::lock_guard<std::mutex> lock(mutex);
                    connection.reset();
                    error = lastError;
                }
                conn->close();
            }

            int retry;
            {
                std::lock_guard<std::mutex> lock(mutex);
                if (stopping) break;
                retry = attempts;
            }

            if (retry >= config.max_reconnect_attempts) {
                setState(ConnectionState::Failed);
                reportError("connection lost after " + std::to_string(retry) +
                            " reconnect attempts: " + error, true);
                return;
            }

            reportError(opened ? "connection lost: " + error : "connect failed: " + error, false);

            {
                std::lock_guard<std::mutex> lock(mutex);
                retry = ++attempts;
            }
            setState(ConnectionState::Reconnecting);

            const auto delay = std::chrono::milliseconds(retry * config.reconnect_base_delay_ms);
            std::cout << "[TransportClient] Reconnecting in " << delay.count() << "ms (attempt "
                      << retry << "/" << config.max_reconnect_attempts << ")" << std::endl;
            if (!waitFor(delay)) {
                break;
            }
        }

        setState(ConnectionState::Disconnected);
    }

    void runHeartbeat() {
        const auto interval = std::chrono::milliseconds(config.heartbeat_interval_ms);

        while (waitFor(interval)) {
            std::shared_ptr<Connection> conn;
            bool timedOut = false;
            {
                std::lock_guard<std::mutex> lock(mutex);
                conn = connection;
                if (!conn) continue;
                timedOut = pingOutstanding && lastInbound < pingSentAt;
                if (!timedOut) {
                    pingSentAt = Clock::now();
                    pingOutstanding = true;
                } else {
                    pingOutstanding = false;
                    heartbeatTimedOut = true;
                }
            }

            if (timedOut) {
                std::cerr << "[TransportClient] No response to ping, dropping connection" << std::endl;
                conn->close();
                continue;
            }

            std::string error;
            if (!conn->send(protocol::encodePing(), error)) {
                std::cerr << "[TransportClient] Ping failed: " << error << std::endl;
            }
        }
    }

    std::shared_ptr<Connection> current() {
        std::lock_guard<std::mutex> lock(mutex);
        return state == ConnectionState::Connected ? connection : nullptr;
    }
};

TransportClient::TransportClient(ConnectionFactory factory, std::string url, const TransportConfig& config)
    : impl_(std::make_unique<Impl>(std::move(factory), std::move(url), config)) {
}

TransportClient::~TransportClient() {
    disconnect();
}

void TransportClient::setCallbacks(TransportCallbacks callbacks) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->callbacks = std::move(callbacks);
}

void TransportClient::connect() {
    bool restart = false;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        if (impl_->supervisor.joinable()) {
            if (impl_->state != ConnectionState::Failed) {
                return;
            }
            restart = true;
        }
    }
    if (restart) {
        disconnect();
    }
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        impl_->stopping = false;
        impl_->attempts = 0;
        impl_->lastError.clear();
    }
    std::cout << "[TransportClient] Connecting to " << impl_->url << std::endl;
    impl_->supervisor = std::thread([this] { impl_->runSupervisor(); });
    impl_->heartbeat = std::thread([this] { impl_->runHeartbeat(); });
}

void TransportClient::disconnect() {
    std::shared_ptr<Connection> conn;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        impl_->stopping = true;
        conn = impl_->connection;
    }
    impl_->cv.notify_all();
    if (conn) {
        conn->close();
    }
    if (impl_->supervisor.joinable()) {
        impl_->supervisor.join();
    }
    if (impl_->heartbeat.joinable()) {
        impl_->heartbeat.join();
    }
    impl_->setState(ConnectionState::Disconnected);
}

bool TransportClient::waitForConnection(int timeout_ms) {
    std::unique_lock<std::mutex> lock(impl_->mutex);
    impl_->cv.wait_for(lock, std::chrono::milliseconds(timeout_ms), [this] {
        return impl_->state == ConnectionState::Connected || impl_->state == ConnectionState::Failed;
    });
    return impl_->state == ConnectionState::Connected;
}

ConnectionState TransportClient::state() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->state;
}

bool TransportClient::isConnected() const {
    return state() == ConnectionState::Connected;
}

int TransportClient::reconnectAttempts() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->attempts;
}

std::string TransportClient::lastError() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->lastError;
}

bool TransportClient::sendText(const std::string& content, std::string& error) {
    auto conn = impl_->current();
    if (!conn) {
        error = "not connected";
        return false;
    }
    return conn->send(protocol::encodeText(content, sessionId()), error);
}

bool TransportClient::sendClear(std::string& error) {
    auto conn = impl_->current();
    if (!conn) {
        error = "not connected";
        return false;
    }
    return conn->send(protocol::encodeClear(sessionId()), error);
}

void TransportClient::sendInterrupt() {
    auto conn = impl_->current();
    if (!conn) return;
    std::string error;
    if (!conn->send(protocol::encodeInterrupt(), error)) {
        std::cerr << "[TransportClient] Interrupt not delivered: " << error << std::endl;
    }
}

void TransportClient::sendPing() {
    auto conn = impl_->current();
    if (!conn) return;
    std::string error;
    if (!conn->send(protocol::encodePing(), error)) {
        std::cerr << "[TransportClient] Ping failed: " << error << std::endl;
    }
}

std::string TransportClient::sessionId() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->session_id;
}

std::string TransportClient::newSession() {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->session_id = generateSessionId();
    std::cout << "[TransportClient] New session " << impl_->session_id << std::endl;
    return impl_->session_id;
}

} // namespace parley::transport
