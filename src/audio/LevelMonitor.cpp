/**
 * LevelMonitor.cpp - Moving-average RMS level
 */

#include "parley/audio/LevelMonitor.hpp"

#include <algorithm>
#include <cmath>

namespace parley::audio {

LevelMonitor::LevelMonitor(size_t history_size)
    : history_size_(std::max<size_t>(1, history_size)) {
}

float LevelMonitor::rms(const float* samples, size_t count) {
    if (!samples || count == 0) return 0.0f;

    double sum = 0.0;
    for (size_t i = 0; i < count; ++i) {
        sum += static_cast<double>(samples[i]) * samples[i];
    }
    return static_cast<float>(std::sqrt(sum / static_cast<double>(count)));
}

float LevelMonitor::process(const float* samples, size_t count) {
    const float value = rms(samples, count);

    history_.push_back(value);
    sum_ += value;
    if (history_.size() > history_size_) {
        sum_ -= history_.front();
        history_.pop_front();
    }

    const float smoothed = sum_ / static_cast<float>(history_.size());
    const float normalized = std::clamp(smoothed * 10.0f, 0.0f, 1.0f);
    level_.store(normalized, std::memory_order_relaxed);
    return normalized;
}

void LevelMonitor::reset() {
    history_.clear();
    sum_ = 0.0f;
    level_.store(0.0f, std::memory_order_relaxed);
}

} // namespace parley::audio
