/**
 * Wav.hpp - RIFF/WAVE decoding and resampling helpers
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace parley::audio {

struct WavData {
    std::vector<float> samples;  // Mono, [-1, 1]
    int sample_rate = 0;
};

/**
 * Decode 16/24-bit PCM or 32-bit float WAV bytes. Multi-channel input is
 * downmixed to mono. Returns false and sets `error` on malformed input.
 */
bool decodeWav(const std::vector<uint8_t>& bytes, WavData& out, std::string& error);

/**
 * Linear-interpolation resampler.
 */
std::vector<float> resample(const std::vector<float>& samples, int from_rate, int to_rate);

} // namespace parley::audio
