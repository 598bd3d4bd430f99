/**
 * Wav.cpp - RIFF/WAVE decoding and resampling helpers
 *
 * Walks the chunk list instead of assuming a 44-byte header, since synthesis
 * servers often emit LIST chunks before "data".
 */

#include "parley/audio/Wav.hpp"

#include <algorithm>
#include <cstring>

namespace parley::audio {

namespace {

template <typename T>
T readLE(const std::vector<uint8_t>& bytes, size_t offset) {
    T value;
    std::memcpy(&value, bytes.data() + offset, sizeof(T));
    return value;
}

float sampleAt(const std::vector<uint8_t>& bytes, size_t offset, uint16_t bits, uint16_t format) {
    if (bits == 16) {
        return static_cast<float>(readLE<int16_t>(bytes, offset)) / 32768.0f;
    }
    if (bits == 24) {
        int32_t v = (bytes[offset] << 8) | (bytes[offset + 1] << 16) | (bytes[offset + 2] << 24);
        v >>= 8;  // Sign-extend
        return static_cast<float>(v) / 8388608.0f;
    }
    if (bits == 32 && format == 3) {
        return readLE<float>(bytes, offset);
    }
    return 0.0f;
}

} // anonymous namespace

bool decodeWav(const std::vector<uint8_t>& bytes, WavData& out, std::string& error) {
    if (bytes.size() < 12 || std::memcmp(bytes.data(), "RIFF", 4) != 0 ||
        std::memcmp(bytes.data() + 8, "WAVE", 4) != 0) {
        error = "not a RIFF/WAVE payload";
        return false;
    }

    uint16_t format = 0;
    uint16_t channels = 0;
    uint16_t bits = 0;
    int rate = 0;
    size_t data_offset = 0;
    size_t data_size = 0;

    size_t pos = 12;
    while (pos + 8 <= bytes.size()) {
        const uint32_t chunk_size = readLE<uint32_t>(bytes, pos + 4);
        const size_t body = pos + 8;

        if (std::memcmp(bytes.data() + pos, "fmt ", 4) == 0 && body + 16 <= bytes.size()) {
            format = readLE<uint16_t>(bytes, body);
            channels = readLE<uint16_t>(bytes, body + 2);
            rate = static_cast<int>(readLE<uint32_t>(bytes, body + 4));
            bits = readLE<uint16_t>(bytes, body + 14);
        } else if (std::memcmp(bytes.data() + pos, "data", 4) == 0) {
            data_offset = body;
            // Streaming servers write 0 or 0xFFFFFFFF when the length is unknown
            data_size = std::min<size_t>(chunk_size, bytes.size() - body);
            if (chunk_size == 0) data_size = bytes.size() - body;
            break;
        }

        pos = body + chunk_size + (chunk_size & 1);
    }

    if (channels == 0 || rate <= 0) {
        error = "missing fmt chunk";
        return false;
    }
    if (data_offset == 0) {
        error = "missing data chunk";
        return false;
    }
    const bool supported = (format == 1 && (bits == 16 || bits == 24)) ||
                           (format == 3 && bits == 32) ||
                           (format == 0xFFFE && (bits == 16 || bits == 24));
    if (!supported) {
        error = "unsupported WAV encoding (format=" + std::to_string(format) +
                ", bits=" + std::to_string(bits) + ")";
        return false;
    }

    const size_t frame_bytes = static_cast<size_t>(bits / 8) * channels;
    const size_t frames = data_size / frame_bytes;

    out.sample_rate = rate;
    out.samples.clear();
    out.samples.reserve(frames);

    for (size_t f = 0; f < frames; ++f) {
        float mixed = 0.0f;
        for (uint16_t c = 0; c < channels; ++c) {
            mixed += sampleAt(bytes, data_offset + f * frame_bytes + c * (bits / 8), bits, format);
        }
        out.samples.push_back(std::clamp(mixed / channels, -1.0f, 1.0f));
    }

    return true;
}

std::vector<float> resample(const std::vector<float>& samples, int from_rate, int to_rate) {
    if (samples.empty() || from_rate <= 0 || to_rate <= 0 || from_rate == to_rate) {
        return samples;
    }

    const double ratio = static_cast<double>(to_rate) / from_rate;
    const size_t new_size = static_cast<size_t>(samples.size() * ratio);
    std::vector<float> resampled(new_size);

    for (size_t i = 0; i < new_size; ++i) {
        const double src_pos = i / ratio;
        const size_t idx = static_cast<size_t>(src_pos);
        const double frac = src_pos - idx;

        if (idx + 1 < samples.size()) {
            resampled[i] = static_cast<float>(samples[idx] * (1.0 - frac) + samples[idx + 1] * frac);
        } else {
            resampled[i] = samples.back();
        }
    }

    return resampled;
}

} // namespace parley::audio
