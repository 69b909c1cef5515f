#pragma once

#include <cstdint>

// Identifies one client connection for the lifetime of the daemon. Never reused.
using SessionId = uint64_t;
