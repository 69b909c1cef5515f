#include "protocol/frame_codec.hpp"

#include <format>

namespace frame {

std::expected<std::string, std::string> encode(std::string_view payload, size_t max_payload) {
    if (payload.size() > max_payload) {
        return std::unexpected(std::format("payload of {} bytes exceeds limit of {}",
                                           payload.size(), max_payload));
    }

    auto len = static_cast<uint32_t>(payload.size());
    std::string out;
    out.reserve(HEADER_SIZE + payload.size());
    out.push_back(static_cast<char>((len >> 24) & 0xFF));
    out.push_back(static_cast<char>((len >> 16) & 0xFF));
    out.push_back(static_cast<char>((len >> 8) & 0xFF));
    out.push_back(static_cast<char>(len & 0xFF));
    out.append(payload);
    return out;
}

Decoder::Decoder(size_t max_payload) : max_payload_(max_payload) {}

void Decoder::feed(const char* data, size_t len) {
    if (failed()) return;

    // Compact once the consumed prefix dominates the buffer.
    if (pos_ > 0 && pos_ >= buf_.size() / 2) {
        buf_.erase(0, pos_);
        pos_ = 0;
    }
    buf_.append(data, len);
}

std::expected<std::optional<std::string>, std::string> Decoder::next() {
    if (failed()) return std::unexpected(error_);

    size_t avail = buf_.size() - pos_;
    if (avail < HEADER_SIZE) return std::nullopt;

    auto* h = reinterpret_cast<const unsigned char*>(buf_.data() + pos_);
    uint32_t len = (uint32_t(h[0]) << 24) | (uint32_t(h[1]) << 16) |
                   (uint32_t(h[2]) << 8) | uint32_t(h[3]);

    if (len > max_payload_) {
        if (h[0] == '{') {
            error_ = "protocol mismatch: payload sent without 4-byte length prefix";
        } else {
            error_ = std::format("frame of {} bytes exceeds limit of {}", len, max_payload_);
        }
        return std::unexpected(error_);
    }

    if (avail - HEADER_SIZE < len) return std::nullopt;

    std::string payload = buf_.substr(pos_ + HEADER_SIZE, len);
    pos_ += HEADER_SIZE + len;
    if (pos_ == buf_.size()) {
        buf_.clear();
        pos_ = 0;
    }
    return payload;
}

std::expected<void, std::string> Decoder::finish() const {
    if (failed()) return std::unexpected(error_);
    if (buffered() > 0) {
        return std::unexpected(std::format("stream closed mid-frame ({} bytes pending)", buffered()));
    }
    return {};
}

void Decoder::reset() {
    buf_.clear();
    pos_ = 0;
    error_.clear();
}

} // namespace frame
