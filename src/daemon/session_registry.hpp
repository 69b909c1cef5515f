#pragma once

#include "session_id.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <string>
#include <string_view>
#include <vector>

// One connected client and its bounded queue of encoded outbound frames.
class Session {
public:
    enum class Enqueue { Queued, DroppedOldest, Overflow, Dead };

    Session(SessionId id, int fd, size_t capacity);

    SessionId id() const { return id_; }
    int fd() const { return fd_; }

    // Events may be dropped oldest-first when the queue is full. Responses are
    // never dropped; if a frame cannot be made room for, the session is marked
    // dead and must be evicted.
    Enqueue enqueue(std::string frame, bool is_event);

    bool has_pending() const { return !queue_.empty(); }
    // Unwritten remainder of the front frame.
    std::string_view pending() const;
    // Mark n bytes of pending() as written.
    void consume(size_t n);

    size_t queued() const { return queue_.size(); }
    uint64_t dropped_events() const { return dropped_; }

    bool alive() const { return alive_; }
    void mark_dead() { alive_ = false; }

    // Stop accepting input; the session dies once its queue drains.
    void close_after_flush() { closing_ = true; }
    bool closing() const { return closing_; }

private:
    struct Frame {
        std::string bytes;
        bool is_event;
    };

    SessionId id_;
    int fd_;
    size_t capacity_;
    std::deque<Frame> queue_;
    size_t offset_ = 0;  // bytes of queue_.front() already written
    uint64_t dropped_ = 0;
    bool alive_ = true;
    bool closing_ = false;
};

class SessionRegistry {
public:
    explicit SessionRegistry(size_t queue_capacity);

    SessionRegistry(const SessionRegistry&) = delete;
    SessionRegistry& operator=(const SessionRegistry&) = delete;

    Session& add(int fd);

    // Idempotent. Returns false if the session was already gone.
    bool remove(SessionId id);

    Session* find(SessionId id);
    Session* find_by_fd(int fd);
    bool contains(SessionId id) const { return sessions_.contains(id); }

    template <typename F>
    void for_each(F&& fn) {
        for (auto& [id, session] : sessions_) fn(session);
    }

    std::vector<SessionId> dead_sessions() const;
    size_t size() const { return sessions_.size(); }

private:
    std::map<SessionId, Session> sessions_;
    SessionId next_id_ = 1;
    size_t queue_capacity_;
};
