#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

// Lock-free single-producer single-consumer ring of PCM samples.
// Producer is the PipeWire process callback; consumer is the control thread.
class RingBuffer {
public:
    explicit RingBuffer(size_t capacity_samples)
        : buf_(capacity_samples), capacity_(capacity_samples) {}

    // Producer. Samples that do not fit are dropped and counted as overrun.
    size_t write(std::span<const int16_t> samples) {
        size_t w = write_pos_.load(std::memory_order_relaxed);
        size_t r = read_pos_.load(std::memory_order_acquire);

        size_t free = capacity_ - (w - r);
        size_t n = std::min(samples.size(), free);
        if (n < samples.size()) {
            overruns_.fetch_add(samples.size() - n, std::memory_order_relaxed);
        }
        if (n == 0) return 0;

        size_t offset = w % capacity_;
        size_t first = std::min(n, capacity_ - offset);
        std::copy_n(samples.begin(), first, buf_.begin() + offset);
        std::copy_n(samples.begin() + first, n - first, buf_.begin());

        write_pos_.store(w + n, std::memory_order_release);
        return n;
    }

    // Consumer. Appends everything available to `out`, returns the count.
    size_t drain_into(std::vector<int16_t>& out) {
        size_t r = read_pos_.load(std::memory_order_relaxed);
        size_t w = write_pos_.load(std::memory_order_acquire);

        size_t n = w - r;
        if (n == 0) return 0;

        size_t offset = r % capacity_;
        size_t first = std::min(n, capacity_ - offset);
        out.insert(out.end(), buf_.begin() + offset, buf_.begin() + offset + first);
        out.insert(out.end(), buf_.begin(), buf_.begin() + (n - first));

        read_pos_.store(r + n, std::memory_order_release);
        return n;
    }

    size_t available() const {
        size_t w = write_pos_.load(std::memory_order_acquire);
        size_t r = read_pos_.load(std::memory_order_acquire);
        return w - r;
    }

    size_t capacity() const { return capacity_; }
    uint64_t overruns() const { return overruns_.load(std::memory_order_relaxed); }

    // Only valid while the producer is stopped.
    void reset() {
        read_pos_.store(0, std::memory_order_relaxed);
        write_pos_.store(0, std::memory_order_relaxed);
        overruns_.store(0, std::memory_order_relaxed);
    }

private:
    std::vector<int16_t> buf_;
    size_t capacity_;
    alignas(64) std::atomic<size_t> write_pos_{0};
    alignas(64) std::atomic<size_t> read_pos_{0};
    std::atomic<uint64_t> overruns_{0};
};
