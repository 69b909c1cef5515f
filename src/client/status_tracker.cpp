#include "status_tracker.hpp"

bool StatusTracker::observe(const nlohmann::json& message) {
    if (!message.is_object()) return false;

    auto it = message.find("state");
    if (it == message.end() || !it->is_object()) return false;

    auto seq = it->find("sequence");
    if (seq == it->end() || !seq->is_number_integer()) return false;
    if (!seq->is_number_unsigned() && seq->get<int64_t>() < 0) return false;

    uint64_t value = seq->get<uint64_t>();
    if (sequence_ && value <= *sequence_) {
        ++ignored_;
        return false;
    }

    sequence_ = value;
    state_ = *it;
    ++accepted_;
    return true;
}

void StatusTracker::reset() {
    sequence_.reset();
    state_ = nlohmann::json::object();
    accepted_ = 0;
    ignored_ = 0;
}

std::string StatusTracker::phase() const {
    return state_.value("phase", std::string("unknown"));
}
