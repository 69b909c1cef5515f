#include "platform/platform_paths.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <format>
#include <sys/stat.h>
#include <unistd.h>

namespace platform {

std::string config_dir() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg) return std::string(xdg) + "/v2m";
    const char* home = std::getenv("HOME");
    if (!home) return {};
    return std::string(home) + "/.config/v2m";
}

std::string runtime_dir() {
    const char* xdg = std::getenv("XDG_RUNTIME_DIR");
    if (xdg && *xdg) return std::string(xdg) + "/v2m";
    return std::format("/tmp/v2m_{}", ::getuid());
}

std::string ipc_endpoint() {
    return runtime_dir() + "/v2m.sock";
}

std::string pid_file() {
    return runtime_dir() + "/v2m_daemon.pid";
}

std::expected<void, std::string> ensure_private_dir(const std::string& path) {
    if (::mkdir(path.c_str(), 0700) < 0 && errno != EEXIST) {
        return std::unexpected(std::format("cannot create {}: {}", path, std::strerror(errno)));
    }

    // lstat so a planted symlink is seen as such rather than followed.
    struct stat st{};
    if (::lstat(path.c_str(), &st) < 0) {
        return std::unexpected(std::format("cannot stat {}: {}", path, std::strerror(errno)));
    }
    if (S_ISLNK(st.st_mode)) {
        return std::unexpected(std::format("{} is a symlink, refusing to use it", path));
    }
    if (!S_ISDIR(st.st_mode)) {
        return std::unexpected(std::format("{} is not a directory", path));
    }
    if (st.st_uid != ::geteuid()) {
        return std::unexpected(std::format("{} is owned by uid {}, not the current user", path, st.st_uid));
    }
    if ((st.st_mode & 0077) != 0 && ::chmod(path.c_str(), 0700) < 0) {
        return std::unexpected(std::format("cannot restrict permissions of {}: {}", path, std::strerror(errno)));
    }
    return {};
}

} // namespace platform
