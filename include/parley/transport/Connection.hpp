/**
 * Connection.hpp - Message-oriented duplex connection
 *
 * receive() blocks until a text frame arrives or the connection drops.
 * close() may be called from any thread and unblocks a pending receive().
 */

#pragma once

#include <functional>
#include <memory>
#include <string>

namespace parley::transport {

class Connection {
public:
    virtual ~Connection() = default;

    virtual bool open(const std::string& url, std::string& error) = 0;
    virtual bool send(const std::string& text, std::string& error) = 0;
    virtual bool receive(std::string& text, std::string& error) = 0;
    virtual void close() = 0;
};

using ConnectionFactory = std::function<std::unique_ptr<Connection>()>;

} // namespace parley::transport
