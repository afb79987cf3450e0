#include "platform/daemonizer.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <print>
#include <unistd.h>

namespace platform {

namespace {

void redirect(const char* path, const char* mode, FILE* stream) {
    if (!std::freopen(path, mode, stream)) {
        // stderr may already be gone; nothing left to report to.
        _exit(1);
    }
}

} // namespace

void daemonize(const std::string& log_path) {
    pid_t pid = fork();
    if (pid < 0) {
        std::println(stderr, "fork() failed: {}", std::strerror(errno));
        _exit(1);
    }
    if (pid > 0) _exit(0); // parent exits

    if (setsid() < 0) _exit(1);

    // Fork again so the daemon can never reacquire a controlling terminal
    pid = fork();
    if (pid < 0) _exit(1);
    if (pid > 0) _exit(0);

    redirect("/dev/null", "r", stdin);
    redirect("/dev/null", "w", stdout);
    if (log_path.empty()) {
        redirect("/dev/null", "w", stderr);
    } else {
        redirect(log_path.c_str(), "a", stderr);
        std::setvbuf(stderr, nullptr, _IOLBF, 0);
    }
}

} // namespace platform
