/**
 * netsdr-client
 */

#include "log.hpp"

#include <sys/time.h>
#include <time.h>

#include <iomanip>

LogManager g_log_manager;

namespace {

const char *level_name(uint8_t level) {
    switch (level) {
        case LOG_TRACE:
            return "TRACE";
        case LOG_DEBUG:
            return "DEBUG";
        case LOG_INFO:
            return "INFO";
        case LOG_WARN:
            return "WARN";
        case LOG_ERROR:
            return "ERROR";
        default:
            return "?";
    }
}

}  // namespace

void LogManager::SetOutput(std::ostream *out) {
    std::lock_guard<std::mutex> lock(out_mtx_);
    out_ = (out == nullptr) ? &std::clog : out;
}

void LogManager::Write(uint8_t level, const char *tag, const std::string &content) {
    timeval now {};
    gettimeofday(&now, nullptr);
    tm local {};
    localtime_r(&now.tv_sec, &local);

    // LDEBUG(x) << ... << std::endl must not produce an empty line
    std::string line = content;
    while (!line.empty() && line.back() == '\n') {
        line.pop_back();
    }

    std::lock_guard<std::mutex> lock(out_mtx_);
    (*out_) << std::setfill('0') << std::setw(2) << local.tm_hour << ":" << std::setw(2) << local.tm_min << ":"
            << std::setw(2) << local.tm_sec << "." << std::setw(3) << (now.tv_usec / 1000) << std::setfill(' ')
            << " [" << level_name(level) << "][" << tag << "] " << line << "\n";
    out_->flush();
}
