/**
 * netsdr-client
 */

#pragma once

#include <stdint.h>
#include <sys/types.h>

#include <string>
#include <vector>

// Loops until n bytes are read. Returns the number of bytes read, which is less than n on EOF,
// or -1 on error.
ssize_t readn(int fd, void *buff, size_t n);

// Loops until n bytes are written. Returns n, or -1 on error.
ssize_t writen(int fd, const void *buff, size_t n);

// "ab cd 01" style dump for log lines
std::string to_hex_string(const std::vector<uint8_t> &data);

class ScopedFd {
 public:
    ScopedFd() = default;
    explicit ScopedFd(int fd) : fd_(fd) {}
    ~ScopedFd() { reset(); }

    ScopedFd(const ScopedFd &) = delete;
    ScopedFd &operator=(const ScopedFd &) = delete;
    ScopedFd(ScopedFd &&other) noexcept : fd_(other.release()) {}
    ScopedFd &operator=(ScopedFd &&other) noexcept {
        if (this != &other) {
            reset(other.release());
        }
        return *this;
    }

    int get() const { return fd_; }
    bool valid() const { return fd_ >= 0; }
    int release() {
        int fd = fd_;
        fd_ = -1;
        return fd;
    }
    void reset(int fd = -1);

 private:
    int fd_ = -1;
};
