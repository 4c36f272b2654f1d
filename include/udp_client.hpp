/**
 * netsdr-client
 */

#pragma once

#include <stdint.h>

#include <atomic>
#include <memory>
#include <mutex>
#include <thread>

#include "helpers.hpp"
#include "transport.hpp"

class CancellationToken {
 public:
    CancellationToken() : cancelled_(std::make_shared<std::atomic<bool> >(false)) {}
    void cancel() { cancelled_->store(true); }
    bool is_cancelled() const { return cancelled_->load(); }

 private:
    std::shared_ptr<std::atomic<bool> > cancelled_;
};

/**
 * Data channel over a UDP socket bound to a local port (0 lets the system choose).
 * The receive loop runs in its own thread and checks its cancellation token at every receive boundary.
 */
class UdpClient : public IUdpClient {
 public:
    explicit UdpClient(uint32_t port);
    virtual ~UdpClient();

    // Stops a running loop first. Returns false when the socket cannot be bound.
    virtual bool start_listening() override;
    // Idempotent, never throws.
    virtual void stop_listening() override;
    virtual bool is_listening() const override { return listening_.load(); }
    virtual void set_message_handler(MessageHandler handler) override;

    uint32_t port() const { return port_; }
    // actual local port of the current or last loop
    uint32_t bound_port() const { return bound_port_.load(); }

 private:
    void stop_worker();
    void listening_worker(ScopedFd sock, CancellationToken token);

    uint32_t port_ = 0;
    std::atomic<uint32_t> bound_port_{0};
    std::atomic<bool> listening_{false};

    std::unique_ptr<CancellationToken> cts_;
    std::shared_ptr<std::thread> listening_worker_;
    std::mutex state_mtx_;

    MessageHandler handler_;
    std::mutex handler_mtx_;

    const int poll_interval_ms_ = 100;
    const size_t max_datagram_size_ = 65536;
};
