#pragma once

#include <expected>
#include <string>

namespace platform {

std::string config_dir();

// Per-user directory holding the socket and pid file:
// $XDG_RUNTIME_DIR/v2m, or /tmp/v2m_<uid> without XDG.
std::string runtime_dir();

std::string ipc_endpoint();
std::string pid_file();

// Creates `path` with mode 0700 or validates an existing one. Fails if it is a
// symlink, not a directory, or owned by another user. Group/other permission
// bits on an owned directory are stripped.
std::expected<void, std::string> ensure_private_dir(const std::string& path);

} // namespace platform
