/**
 * LevelMonitor.hpp - Smoothed microphone level for visual feedback
 *
 * Derived signal only. Nothing in the conversation state depends on it.
 */

#pragma once

#include <atomic>
#include <cstddef>
#include <deque>

namespace parley::audio {

class LevelMonitor {
public:
    explicit LevelMonitor(size_t history_size = 8);

    /**
     * Feed one capture buffer. Returns the new normalized level.
     */
    float process(const float* samples, size_t count);

    /**
     * Latest normalized level in [0, 1]. Safe from any thread.
     */
    float level() const { return level_.load(std::memory_order_relaxed); }

    void reset();

    static float rms(const float* samples, size_t count);

private:
    size_t history_size_;
    std::deque<float> history_;
    float sum_ = 0.0f;
    std::atomic<float> level_{0.0f};
};

} // namespace parley::audio
