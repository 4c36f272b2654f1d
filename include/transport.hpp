/**
 * netsdr-client
 */

#pragma once

#include <stdint.h>

#include <functional>
#include <vector>

using MessageHandler = std::function<void(const std::vector<uint8_t> &)>;

/**
 * Command channel. The handler is called from the transport's own thread once per complete inbound
 * frame and must return quickly.
 */
class ITcpClient {
 public:
    virtual ~ITcpClient() {}
    virtual void connect() = 0;
    virtual void disconnect() = 0;
    virtual bool connected() const = 0;
    // throws std::runtime_error when the bytes cannot be written
    virtual void send(const std::vector<uint8_t> &data) = 0;
    // returns once no call of the previous handler is in flight
    virtual void set_message_handler(MessageHandler handler) = 0;
};

/**
 * Data channel. start_listening() returns once the receive loop runs in the background; the handler is
 * called once per datagram until stop_listening().
 */
class IUdpClient {
 public:
    virtual ~IUdpClient() {}
    virtual bool start_listening() = 0;
    virtual void stop_listening() = 0;
    virtual bool is_listening() const = 0;
    // returns once no call of the previous handler is in flight
    virtual void set_message_handler(MessageHandler handler) = 0;
};
