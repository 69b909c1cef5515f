#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>
#include <vector>

class AudioCapture {
public:
    virtual ~AudioCapture() = default;
    virtual std::expected<void, std::string> open() = 0;
    // Appends samples captured since the last read.
    virtual size_t read(std::vector<int16_t>& out) = 0;
    virtual void close() = 0;
    virtual bool is_open() const = 0;
    // The source broke after a successful open (device unplugged, stream error).
    virtual bool failed() const = 0;
};
