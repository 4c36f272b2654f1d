/**
 * netsdr-client
 */

#include "failure_handle.hpp"

#include <execinfo.h>
#include <signal.h>
#include <string.h>
#include <unistd.h>

namespace {

const int kMaxFrames = 64;

void write_stderr(const char *text) {
    ssize_t ret = write(STDERR_FILENO, text, strlen(text));
    (void)ret;
}

void failure_handler(int sig) {
    write_stderr("*** Fatal signal: ");
    write_stderr(strsignal(sig));
    write_stderr(", backtrace:\n");
    void *frames[kMaxFrames];
    int size = backtrace(frames, kMaxFrames);
    backtrace_symbols_fd(frames, size, STDERR_FILENO);

    signal(sig, SIG_DFL);
    raise(sig);
}

}  // namespace

void InitFailureHandle() {
    // loads libgcc ahead of time so backtrace() does not allocate inside the handler
    void *frames[1];
    backtrace(frames, 1);

    struct sigaction action;
    memset(&action, 0, sizeof(action));
    action.sa_handler = failure_handler;
    sigemptyset(&action.sa_mask);
    action.sa_flags = SA_RESETHAND;
    sigaction(SIGSEGV, &action, nullptr);
    sigaction(SIGABRT, &action, nullptr);
    sigaction(SIGFPE, &action, nullptr);
    sigaction(SIGBUS, &action, nullptr);
}
