/**
 * netsdr-client
 */

#include "helpers.hpp"

#include <errno.h>
#include <unistd.h>

#include <cstdio>

ssize_t readn(int fd, void *buff, size_t n) {
    size_t left = n;
    char *ptr = static_cast<char *>(buff);
    while (left > 0) {
        ssize_t nread = read(fd, ptr, left);
        if (nread < 0) {
            if (errno == EINTR) {
                continue;
            }
            return -1;
        } else if (nread == 0) {
            break;
        }
        left -= nread;
        ptr += nread;
    }
    return n - left;
}

ssize_t writen(int fd, const void *buff, size_t n) {
    size_t left = n;
    const char *ptr = static_cast<const char *>(buff);
    while (left > 0) {
        ssize_t nwritten = write(fd, ptr, left);
        if (nwritten <= 0) {
            if (nwritten < 0 && errno == EINTR) {
                continue;
            }
            return -1;
        }
        left -= nwritten;
        ptr += nwritten;
    }
    return n;
}

std::string to_hex_string(const std::vector<uint8_t> &data) {
    std::string out;
    out.reserve(data.size() * 3);
    char buff[4];
    for (size_t i = 0; i < data.size(); ++i) {
        snprintf(buff, sizeof(buff), "%02x", data[i]);
        if (i > 0) {
            out += ' ';
        }
        out += buff;
    }
    return out;
}

void ScopedFd::reset(int fd) {
    if (fd_ >= 0) {
        close(fd_);
    }
    fd_ = fd;
}
