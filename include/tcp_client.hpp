/**
 * netsdr-client
 */

#pragma once

#include <stdint.h>

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "helpers.hpp"
#include "transport.hpp"

/**
 * Command channel over a TCP socket. A receive worker cuts the byte stream into frames using the
 * length field of each frame header and hands every complete frame to the message handler.
 */
class TcpClient : public ITcpClient {
 public:
    TcpClient(const std::string &host, uint32_t port);
    virtual ~TcpClient();

    // Drops any previous connection first. Failures are logged and leave the client disconnected.
    virtual void connect() override;
    virtual void disconnect() override;
    virtual bool connected() const override { return connected_.load(); }
    virtual void send(const std::vector<uint8_t> &data) override;
    virtual void set_message_handler(MessageHandler handler) override;

    const std::string &host() const { return host_; }
    uint32_t port() const { return port_; }

 private:
    void close_connection();
    void receive_worker(int fd);

    std::string host_;
    uint32_t port_ = 0;

    ScopedFd sock_;
    std::atomic<bool> connected_{false};
    std::shared_ptr<std::thread> receive_worker_;
    std::mutex state_mtx_;

    MessageHandler handler_;
    std::mutex handler_mtx_;
};
