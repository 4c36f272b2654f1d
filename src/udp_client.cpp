/**
 * netsdr-client
 */

#include "udp_client.hpp"

#include <arpa/inet.h>
#include <errno.h>
#include <netinet/in.h>
#include <poll.h>
#include <string.h>
#include <strings.h>
#include <sys/socket.h>

#include <vector>

#include "log.hpp"

UdpClient::UdpClient(uint32_t port) : port_(port) {}

UdpClient::~UdpClient() { stop_listening(); }

bool UdpClient::start_listening() {
    std::lock_guard<std::mutex> lock(state_mtx_);
    stop_worker();

    LINFO(UdpClient) << "Start listening for UDP messages...";
    ScopedFd sock(socket(AF_INET, SOCK_DGRAM, 0));
    if (!sock.valid()) {
        LERROR(UdpClient) << "Error receiving message: failed to create socket, " << strerror(errno);
        return false;
    }
    sockaddr_in listening_addr;
    bzero(&listening_addr, sizeof(listening_addr));
    listening_addr.sin_family = AF_INET;
    listening_addr.sin_addr.s_addr = htonl(INADDR_ANY);
    listening_addr.sin_port = htons(static_cast<uint16_t>(port_));
    if (bind(sock.get(), reinterpret_cast<sockaddr *>(&listening_addr), sizeof(listening_addr)) < 0) {
        LERROR(UdpClient) << "Error receiving message: failed to bind port " << port_ << ", " << strerror(errno);
        return false;
    }
    sockaddr_in socket_addr;
    bzero(&socket_addr, sizeof(socket_addr));
    socklen_t addr_size = sizeof(socket_addr);
    if (getsockname(sock.get(), reinterpret_cast<sockaddr *>(&socket_addr), &addr_size) == 0) {
        bound_port_.store(ntohs(socket_addr.sin_port));
    }

    cts_.reset(new CancellationToken());
    listening_.store(true);
    listening_worker_ =
        std::make_shared<std::thread>(&UdpClient::listening_worker, this, std::move(sock), *cts_);
    return true;
}

void UdpClient::stop_listening() {
    std::lock_guard<std::mutex> lock(state_mtx_);
    stop_worker();
}

void UdpClient::stop_worker() {
    if (cts_ != nullptr) {
        cts_->cancel();
    }
    if (listening_worker_ != nullptr) {
        if (listening_worker_->get_id() == std::this_thread::get_id()) {
            listening_worker_->detach();
        } else if (listening_worker_->joinable()) {
            listening_worker_->join();
        }
        listening_worker_.reset();
    }
    cts_.reset();
    listening_.store(false);
}

void UdpClient::set_message_handler(MessageHandler handler) {
    std::lock_guard<std::mutex> lock(handler_mtx_);
    handler_ = std::move(handler);
}

void UdpClient::listening_worker(ScopedFd sock, CancellationToken token) {
    std::vector<uint8_t> buff(max_datagram_size_);
    pollfd poll_fd;
    poll_fd.fd = sock.get();
    poll_fd.events = POLLIN;

    while (!token.is_cancelled()) {
        poll_fd.revents = 0;
        int ret = poll(&poll_fd, 1, poll_interval_ms_);
        if (ret < 0) {
            if (errno == EINTR) {
                continue;
            }
            LERROR(UdpClient) << "Error receiving message: " << strerror(errno);
            break;
        } else if (ret == 0) {
            continue;
        }

        sockaddr_in peer_addr;
        bzero(&peer_addr, sizeof(peer_addr));
        socklen_t addr_size = sizeof(peer_addr);
        ssize_t read_size =
            recvfrom(sock.get(), buff.data(), buff.size(), 0, reinterpret_cast<sockaddr *>(&peer_addr), &addr_size);
        if (read_size < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
                continue;
            }
            LERROR(UdpClient) << "Error receiving message: " << strerror(errno);
            break;
        }

        char peer_ip[INET_ADDRSTRLEN] = {0};
        inet_ntop(AF_INET, &peer_addr.sin_addr, peer_ip, sizeof(peer_ip));
        LDEBUG(UdpClient) << "Received from " << peer_ip << ":" << ntohs(peer_addr.sin_port) << ", " << read_size
                          << " bytes";

        std::lock_guard<std::mutex> lock(handler_mtx_);
        if (handler_) {
            handler_(std::vector<uint8_t>(buff.begin(), buff.begin() + read_size));
        }
    }
    listening_.store(false);
    LDEBUG(UdpClient) << "Stopped listening on port " << bound_port_.load();
}
