#pragma once

#include "daemon_state.hpp"
#include "session_registry.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>

// Fans state events out to every live session without blocking on any of them.
class BroadcastHub {
public:
    BroadcastHub(SessionRegistry& sessions, size_t max_frame_bytes, bool verbose = false);

    // Returns the number of sessions the event was queued for.
    size_t publish(const StateEvent& ev);

    uint64_t published() const { return published_; }

private:
    // Encoded frame, trimmed to fit the frame limit when the payload is too large.
    std::expected<std::string, std::string> encode_event(const StateEvent& ev) const;

    SessionRegistry& sessions_;
    size_t max_frame_bytes_;
    bool verbose_;
    uint64_t published_ = 0;
};
