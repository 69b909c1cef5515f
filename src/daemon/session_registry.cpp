#include "session_registry.hpp"

#include <algorithm>

Session::Session(SessionId id, int fd, size_t capacity)
    : id_(id), fd_(fd), capacity_(std::max<size_t>(capacity, 2)) {}

Session::Enqueue Session::enqueue(std::string frame, bool is_event) {
    if (!alive_) return Enqueue::Dead;

    Enqueue result = Enqueue::Queued;
    if (queue_.size() >= capacity_) {
        // The front frame may be partially written; it is never dropped.
        auto victim = std::find_if(queue_.begin() + (offset_ > 0 ? 1 : 0), queue_.end(),
                                   [](const Frame& f) { return f.is_event; });
        if (victim == queue_.end()) {
            alive_ = false;
            return Enqueue::Overflow;
        }
        queue_.erase(victim);
        ++dropped_;
        result = Enqueue::DroppedOldest;
    }

    queue_.push_back({std::move(frame), is_event});
    return result;
}

std::string_view Session::pending() const {
    if (queue_.empty()) return {};
    std::string_view front = queue_.front().bytes;
    return front.substr(offset_);
}

void Session::consume(size_t n) {
    while (n > 0 && !queue_.empty()) {
        size_t left = queue_.front().bytes.size() - offset_;
        if (n < left) {
            offset_ += n;
            return;
        }
        n -= left;
        queue_.pop_front();
        offset_ = 0;
    }
}

SessionRegistry::SessionRegistry(size_t queue_capacity) : queue_capacity_(queue_capacity) {}

Session& SessionRegistry::add(int fd) {
    SessionId id = next_id_++;
    auto [it, inserted] = sessions_.try_emplace(id, id, fd, queue_capacity_);
    return it->second;
}

bool SessionRegistry::remove(SessionId id) {
    return sessions_.erase(id) > 0;
}

Session* SessionRegistry::find(SessionId id) {
    auto it = sessions_.find(id);
    return it != sessions_.end() ? &it->second : nullptr;
}

Session* SessionRegistry::find_by_fd(int fd) {
    auto it = std::ranges::find_if(sessions_, [fd](const auto& kv) { return kv.second.fd() == fd; });
    return it != sessions_.end() ? &it->second : nullptr;
}

std::vector<SessionId> SessionRegistry::dead_sessions() const {
    std::vector<SessionId> dead;
    for (const auto& [id, session] : sessions_) {
        if (!session.alive() || (session.closing() && !session.has_pending())) {
            dead.push_back(id);
        }
    }
    return dead;
}
