/**
 * netsdr-client
 */

#include <doctest/doctest.h>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <string.h>
#include <sys/socket.h>

#include <atomic>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

#include "helpers.hpp"
#include "message.hpp"
#include "tcp_client.hpp"

namespace {

// Loopback listener standing in for the receiver.
class TestPeer {
 public:
    TestPeer() : listener_(socket(AF_INET, SOCK_STREAM, 0)) {
        sockaddr_in addr;
        memset(&addr, 0, sizeof(addr));
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        REQUIRE(bind(listener_.get(), reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) == 0);
        REQUIRE(listen(listener_.get(), 1) == 0);
        socklen_t addr_size = sizeof(addr);
        REQUIRE(getsockname(listener_.get(), reinterpret_cast<sockaddr *>(&addr), &addr_size) == 0);
        port_ = ntohs(addr.sin_port);
    }

    uint32_t port() const { return port_; }

    bool accept_client() {
        conn_.reset(accept(listener_.get(), nullptr, nullptr));
        return conn_.valid();
    }
    bool write(const std::vector<uint8_t> &data) {
        return writen(conn_.get(), data.data(), data.size()) == static_cast<ssize_t>(data.size());
    }
    std::vector<uint8_t> read(size_t size) {
        std::vector<uint8_t> data(size);
        ssize_t read_size = readn(conn_.get(), data.data(), size);
        data.resize(read_size < 0 ? 0 : read_size);
        return data;
    }
    void close_client() { conn_.reset(); }

 private:
    ScopedFd listener_;
    ScopedFd conn_;
    uint32_t port_ = 0;
};

class FrameCollector {
 public:
    MessageHandler handler() {
        return [this](const std::vector<uint8_t> &frame) {
            std::lock_guard<std::mutex> lock(mtx_);
            frames_.push_back(frame);
        };
    }
    std::vector<std::vector<uint8_t> > frames() {
        std::lock_guard<std::mutex> lock(mtx_);
        return frames_;
    }
    bool wait_for_count(size_t count) {
        for (int i = 0; i < 400; ++i) {
            if (frames().size() >= count) {
                return true;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        return false;
    }

 private:
    std::vector<std::vector<uint8_t> > frames_;
    std::mutex mtx_;
};

uint32_t unused_port() {
    ScopedFd sock(socket(AF_INET, SOCK_STREAM, 0));
    sockaddr_in addr;
    memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    if (bind(sock.get(), reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) != 0) {
        return 0;
    }
    socklen_t addr_size = sizeof(addr);
    getsockname(sock.get(), reinterpret_cast<sockaddr *>(&addr), &addr_size);
    return ntohs(addr.sin_port);
}

}  // namespace

TEST_CASE("Connect failure leaves the client disconnected") {
    uint32_t port = unused_port();
    REQUIRE(port != 0);
    TcpClient client("127.0.0.1", port);
    CHECK_NOTHROW(client.connect());
    CHECK_FALSE(client.connected());
    CHECK_THROWS_AS(client.send({0x04, 0x00, 0x18, 0x00}), std::runtime_error);
    CHECK_NOTHROW(client.disconnect());
}

TEST_CASE("Frames travel both ways and arrive whole") {
    TestPeer peer;
    FrameCollector collector;
    TcpClient client("127.0.0.1", peer.port());
    client.set_message_handler(collector.handler());

    client.connect();
    REQUIRE(client.connected());
    REQUIRE(peer.accept_client());

    std::vector<uint8_t> request =
        get_control_item_message(MSG_SET_CONTROL_ITEM, ITEM_RECEIVER_FREQUENCY, {0x00, 0x90, 0xC6, 0xD5, 0x00, 0x00});
    CHECK_NOTHROW(client.send(request));
    CHECK(peer.read(request.size()) == request);

    std::vector<uint8_t> ack = get_control_item_message(MSG_ACK, ITEM_RECEIVER_FREQUENCY, {0x00});
    std::vector<uint8_t> status = get_control_item_message(MSG_CURRENT_CONTROL_ITEM, ITEM_STATUS, {0x0B});
    // one frame split across writes, then two frames in a single write
    REQUIRE(peer.write(std::vector<uint8_t>(ack.begin(), ack.begin() + 3)));
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    REQUIRE(peer.write(std::vector<uint8_t>(ack.begin() + 3, ack.end())));
    std::vector<uint8_t> both = status;
    both.insert(both.end(), ack.begin(), ack.end());
    REQUIRE(peer.write(both));

    REQUIRE(collector.wait_for_count(3));
    std::vector<std::vector<uint8_t> > frames = collector.frames();
    CHECK(frames[0] == ack);
    CHECK(frames[1] == status);
    CHECK(frames[2] == ack);

    client.disconnect();
    CHECK_FALSE(client.connected());
    CHECK_NOTHROW(client.disconnect());
    CHECK_THROWS_AS(client.send(request), std::runtime_error);
}

TEST_CASE("Peer closing the connection marks the client disconnected") {
    TestPeer peer;
    TcpClient client("127.0.0.1", peer.port());
    client.connect();
    REQUIRE(client.connected());
    REQUIRE(peer.accept_client());

    peer.close_client();
    bool disconnected = false;
    for (int i = 0; i < 400 && !disconnected; ++i) {
        disconnected = !client.connected();
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    CHECK(disconnected);

    // a second connect works on the same client
    client.connect();
    CHECK(client.connected());
    REQUIRE(peer.accept_client());
    client.disconnect();
}

TEST_CASE("Replacing the handler waits for the call in flight") {
    std::atomic<bool> entered{false};
    std::atomic<bool> finished{false};
    TestPeer peer;
    TcpClient client("127.0.0.1", peer.port());
    client.set_message_handler([&entered, &finished](const std::vector<uint8_t> &) {
        entered.store(true);
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        finished.store(true);
    });
    client.connect();
    REQUIRE(client.connected());
    REQUIRE(peer.accept_client());
    REQUIRE(peer.write(get_control_item_message(MSG_ACK, ITEM_RECEIVER_STATE, {0x00})));

    bool was_entered = false;
    for (int i = 0; i < 400 && !was_entered; ++i) {
        was_entered = entered.load();
        if (!was_entered) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
    }
    REQUIRE(was_entered);
    client.set_message_handler(nullptr);
    CHECK(finished.load());
    client.disconnect();
}
