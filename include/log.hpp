/**
 * netsdr-client
 */

#pragma once

#include <stdint.h>

#include <atomic>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

enum LogLevel : uint8_t { LOG_TRACE = 0, LOG_DEBUG, LOG_INFO, LOG_WARN, LOG_ERROR };

class LogManager {
 public:
    void SetLogLevel(uint8_t level) { level_.store(level); }
    uint8_t GetLogLevel() const { return level_.load(); }
    bool IsEnabled(uint8_t level) const { return level >= level_.load(); }

    // nullptr restores std::clog
    void SetOutput(std::ostream *out);

    void Write(uint8_t level, const char *tag, const std::string &content);

 private:
    std::atomic<uint8_t> level_{LOG_INFO};
    std::ostream *out_ = &std::clog;
    std::mutex out_mtx_;
};

extern LogManager g_log_manager;

class LogStream {
 public:
    LogStream(uint8_t level, const char *tag) : level_(level), tag_(tag) {}
    ~LogStream() { g_log_manager.Write(level_, tag_, stream_.str()); }

    LogStream(const LogStream &) = delete;
    LogStream &operator=(const LogStream &) = delete;

    template <typename T>
    LogStream &operator<<(const T &value) {
        stream_ << value;
        return *this;
    }

    // std::endl and friends
    LogStream &operator<<(std::ostream &(*manip)(std::ostream &)) {
        manip(stream_);
        return *this;
    }

 private:
    uint8_t level_;
    const char *tag_;
    std::ostringstream stream_;
};

#define LOG_STREAM(level, tag)              \
    if (!g_log_manager.IsEnabled(level)) { \
    } else                                 \
        LogStream(level, #tag)

#define LTRACE(tag) LOG_STREAM(LOG_TRACE, tag)
#define LDEBUG(tag) LOG_STREAM(LOG_DEBUG, tag)
#define LINFO(tag) LOG_STREAM(LOG_INFO, tag)
#define LWARN(tag) LOG_STREAM(LOG_WARN, tag)
#define LERROR(tag) LOG_STREAM(LOG_ERROR, tag)
