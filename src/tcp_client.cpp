/**
 * netsdr-client
 */

#include "tcp_client.hpp"

#include <errno.h>
#include <netdb.h>
#include <string.h>
#include <strings.h>
#include <sys/socket.h>
#include <unistd.h>

#include <stdexcept>

#include "frame.hpp"
#include "log.hpp"
#include "message.hpp"

TcpClient::TcpClient(const std::string &host, uint32_t port) : host_(host), port_(port) {}

TcpClient::~TcpClient() { disconnect(); }

void TcpClient::connect() {
    std::lock_guard<std::mutex> lock(state_mtx_);
    close_connection();

    addrinfo hints;
    bzero(&hints, sizeof(hints));
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo *result = nullptr;
    int32_t ret;
    if ((ret = getaddrinfo(host_.c_str(), std::to_string(port_).c_str(), &hints, &result)) != 0) {
        LERROR(TcpClient) << "Failed to resolve " << host_ << ":" << port_ << ", " << gai_strerror(ret);
        return;
    }

    ScopedFd sock;
    for (addrinfo *info = result; info != nullptr; info = info->ai_next) {
        sock.reset(socket(info->ai_family, info->ai_socktype, info->ai_protocol));
        if (!sock.valid()) {
            continue;
        }
        if (::connect(sock.get(), info->ai_addr, info->ai_addrlen) == 0) {
            break;
        }
        sock.reset();
    }
    int connect_errno = errno;
    freeaddrinfo(result);

    if (!sock.valid()) {
        LERROR(TcpClient) << "Failed to connect to " << host_ << ":" << port_ << ", err " << strerror(connect_errno);
        return;
    }

    LINFO(TcpClient) << "Connected to " << host_ << ":" << port_;
    sock_ = std::move(sock);
    connected_.store(true);
    receive_worker_ = std::make_shared<std::thread>(&TcpClient::receive_worker, this, sock_.get());
}

void TcpClient::disconnect() {
    std::lock_guard<std::mutex> lock(state_mtx_);
    close_connection();
}

void TcpClient::close_connection() {
    if (sock_.valid()) {
        connected_.store(false);
        shutdown(sock_.get(), SHUT_RDWR);
    }
    if (receive_worker_ != nullptr) {
        if (receive_worker_->get_id() == std::this_thread::get_id()) {
            receive_worker_->detach();
        } else if (receive_worker_->joinable()) {
            receive_worker_->join();
        }
        receive_worker_.reset();
    }
    if (sock_.valid()) {
        sock_.reset();
        LINFO(TcpClient) << "Disconnected from " << host_ << ":" << port_;
    }
}

void TcpClient::send(const std::vector<uint8_t> &data) {
    std::lock_guard<std::mutex> lock(state_mtx_);
    if (!connected_.load() || !sock_.valid()) {
        throw std::runtime_error("TcpClient is not connected");
    }
    if (writen(sock_.get(), data.data(), data.size()) < 0) {
        throw std::runtime_error(std::string("Failed to write to socket: ") + strerror(errno));
    }
    LTRACE(TcpClient) << "Sent " << data.size() << " bytes";
}

void TcpClient::set_message_handler(MessageHandler handler) {
    std::lock_guard<std::mutex> lock(handler_mtx_);
    handler_ = std::move(handler);
}

void TcpClient::receive_worker(int fd) {
    while (true) {
        uint8_t header_buff[kHeaderLength];
        ssize_t read_size = readn(fd, header_buff, kHeaderLength);
        if (read_size < static_cast<ssize_t>(kHeaderLength)) {
            if (read_size < 0) {
                LWARN(TcpClient) << "Failed to read header, err " << strerror(errno);
            }
            break;
        }
        FrameHeader header;
        translate_header(header_buff, kHeaderLength, &header);
        if (header.frame_length < kHeaderLength) {
            LERROR(TcpClient) << "Invalid frame length " << header.frame_length << ", dropping connection";
            break;
        }

        std::vector<uint8_t> frame(header_buff, header_buff + kHeaderLength);
        frame.resize(header.frame_length);
        size_t content_length = header.frame_length - kHeaderLength;
        if (content_length > 0) {
            read_size = readn(fd, frame.data() + kHeaderLength, content_length);
            if (read_size < static_cast<ssize_t>(content_length)) {
                LWARN(TcpClient) << "Failed to read content";
                break;
            }
        }
        LTRACE(TcpClient) << "Received frame of " << frame.size() << " bytes";

        // held across the call, set_message_handler waits for it
        std::lock_guard<std::mutex> lock(handler_mtx_);
        if (handler_) {
            handler_(frame);
        }
    }
    if (connected_.exchange(false)) {
        LWARN(TcpClient) << "Peer closed the connection";
    }
}
