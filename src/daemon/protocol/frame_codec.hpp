#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

// Length-prefixed framing: [4 bytes big-endian length N][N bytes UTF-8 payload].
namespace frame {

inline constexpr size_t HEADER_SIZE = 4;
inline constexpr size_t DEFAULT_MAX_PAYLOAD = 10 * 1024 * 1024;

std::expected<std::string, std::string> encode(std::string_view payload,
                                               size_t max_payload = DEFAULT_MAX_PAYLOAD);

// Incremental decoder for one byte stream. Bytes are fed as they arrive and
// complete payloads are pulled with next(). An error is sticky until reset().
class Decoder {
public:
    explicit Decoder(size_t max_payload = DEFAULT_MAX_PAYLOAD);

    void feed(const char* data, size_t len);
    void feed(std::string_view data) { feed(data.data(), data.size()); }

    // Next complete payload, or std::nullopt when more bytes are needed.
    std::expected<std::optional<std::string>, std::string> next();

    // Call at end of stream. Fails if the stream stopped inside a frame.
    std::expected<void, std::string> finish() const;

    size_t buffered() const { return buf_.size() - pos_; }
    bool failed() const { return !error_.empty(); }
    void reset();

private:
    std::string buf_;
    size_t pos_ = 0;
    size_t max_payload_;
    std::string error_;
};

} // namespace frame
