/**
 * RingBuffer.hpp - Lock-free single-producer/single-consumer ring buffer
 *
 * Producer: the thread queueing playback. Consumer: the audio output callback.
 * clear() may be called from the producer side; the consumer applies it on its next pop().
 */

#pragma once

#include <atomic>
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace parley::audio {

template <typename T>
class RingBuffer {
public:
    explicit RingBuffer(size_t capacity)
        : buffer_(capacity + 1)
        , capacity_(capacity + 1) {}

    /**
     * Push up to `count` items. Returns how many fit.
     */
    size_t push(const T* data, size_t count) {
        const size_t write = write_.load(std::memory_order_relaxed);
        const size_t read = read_.load(std::memory_order_acquire);

        const size_t free_space = (read + capacity_ - write - 1) % capacity_;
        const size_t n = std::min(count, free_space);

        for (size_t i = 0; i < n; ++i) {
            buffer_[(write + i) % capacity_] = data[i];
        }

        write_.store((write + n) % capacity_, std::memory_order_release);
        return n;
    }

    /**
     * Pop up to `count` items into `out`. Returns how many were read.
     */
    size_t pop(T* out, size_t count) {
        size_t read = read_.load(std::memory_order_relaxed);
        const size_t write = write_.load(std::memory_order_acquire);

        if (clear_requested_.exchange(false, std::memory_order_acq_rel)) {
            read_.store(write, std::memory_order_release);
            return 0;
        }

        const size_t stored = (write + capacity_ - read) % capacity_;
        const size_t n = std::min(count, stored);

        for (size_t i = 0; i < n; ++i) {
            out[i] = buffer_[(read + i) % capacity_];
        }

        read_.store((read + n) % capacity_, std::memory_order_release);
        return n;
    }

    size_t available() const {
        if (clear_requested_.load(std::memory_order_acquire)) {
            return 0;
        }
        const size_t write = write_.load(std::memory_order_acquire);
        const size_t read = read_.load(std::memory_order_acquire);
        return (write + capacity_ - read) % capacity_;
    }

    void clear() {
        clear_requested_.store(true, std::memory_order_release);
    }

    size_t capacity() const { return capacity_ - 1; }

private:
    std::vector<T> buffer_;
    const size_t capacity_;
    std::atomic<size_t> read_{0};
    std::atomic<size_t> write_{0};
    std::atomic<bool> clear_requested_{false};
};

} // namespace parley::audio
