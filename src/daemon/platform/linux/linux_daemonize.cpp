#include "platform/daemonizer.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <print>
#include <sys/stat.h>
#include <unistd.h>

namespace platform {

namespace {

void fork_and_exit_parent(const char* stage) {
    pid_t pid = ::fork();
    if (pid < 0) {
        std::println(stderr, "daemonize: {} fork() failed: {}", stage, std::strerror(errno));
        _exit(1);
    }
    if (pid > 0) _exit(0);
}

} // namespace

void daemonize() {
    fork_and_exit_parent("first");
    ::setsid();

    // Second fork so the daemon can never reacquire a controlling terminal.
    fork_and_exit_parent("second");

    ::umask(077);
    if (::chdir("/") < 0) _exit(1);

    int devnull = ::open("/dev/null", O_RDWR | O_CLOEXEC);
    if (devnull < 0) _exit(1);
    ::dup2(devnull, STDIN_FILENO);
    ::dup2(devnull, STDOUT_FILENO);
    ::dup2(devnull, STDERR_FILENO);
    if (devnull > STDERR_FILENO) ::close(devnull);
}

} // namespace platform
