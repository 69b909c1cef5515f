#pragma once

namespace platform {

// Double-fork into the background and point stdio at /dev/null.
void daemonize();

} // namespace platform
