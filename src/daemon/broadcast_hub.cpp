#include "broadcast_hub.hpp"

#include "protocol/frame_codec.hpp"
#include "protocol/messages.hpp"

#include <print>

BroadcastHub::BroadcastHub(SessionRegistry& sessions, size_t max_frame_bytes, bool verbose)
    : sessions_(sessions), max_frame_bytes_(max_frame_bytes), verbose_(verbose) {}

std::expected<std::string, std::string> BroadcastHub::encode_event(const StateEvent& ev) const {
    auto msg = messages::event(ev);
    auto encoded = frame::encode(msg.dump(), max_frame_bytes_);
    if (encoded || !msg["data"].is_object()) return encoded;

    // Over the frame limit: the echoed input goes first, then the whole payload.
    // The phase change itself is always delivered.
    auto& data = msg["data"];
    if (data.contains("original")) {
        data.erase("original");
        data["original_omitted"] = true;
        encoded = frame::encode(msg.dump(), max_frame_bytes_);
        if (encoded) {
            if (verbose_) {
                std::println(stderr, "[v2m] event #{} over frame limit, omitted original text",
                             ev.snapshot.sequence);
            }
            return encoded;
        }
    }

    std::println(stderr, "broadcast: event #{} payload over frame limit, sending without data",
                 ev.snapshot.sequence);
    msg["data"] = {{"omitted", true}};
    return frame::encode(msg.dump(), max_frame_bytes_);
}

size_t BroadcastHub::publish(const StateEvent& ev) {
    auto encoded = encode_event(ev);
    if (!encoded) {
        std::println(stderr, "broadcast: dropping event #{}: {}", ev.snapshot.sequence, encoded.error());
        return 0;
    }
    ++published_;

    size_t delivered = 0;
    sessions_.for_each([&](Session& s) {
        if (!s.alive() || s.closing()) return;

        switch (s.enqueue(*encoded, true)) {
            case Session::Enqueue::Queued:
                ++delivered;
                break;
            case Session::Enqueue::DroppedOldest:
                ++delivered;
                if (verbose_) {
                    std::println(stderr, "[v2m] session {} lagging, dropped oldest event ({} total)",
                                 s.id(), s.dropped_events());
                }
                break;
            case Session::Enqueue::Overflow:
                std::println(stderr, "broadcast: session {} queue full of responses, evicting", s.id());
                break;
            case Session::Enqueue::Dead:
                break;
        }
    });
    return delivered;
}
