#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

// Client-side view of the daemon state, fed by pushed events and by polled
// GET_STATUS responses. A snapshot is accepted only if its sequence number is
// newer than the last accepted one, so a late poll never rolls the view back.
class StatusTracker {
public:
    // Returns true if the message carried a newer snapshot.
    bool observe(const nlohmann::json& message);

    // Forget everything, e.g. after reconnecting to a restarted daemon.
    void reset();

    std::optional<uint64_t> sequence() const { return sequence_; }
    std::string phase() const;
    const nlohmann::json& state() const { return state_; }

    uint64_t accepted() const { return accepted_; }
    uint64_t ignored() const { return ignored_; }

private:
    std::optional<uint64_t> sequence_;
    nlohmann::json state_ = nlohmann::json::object();
    uint64_t accepted_ = 0;
    uint64_t ignored_ = 0;
};
