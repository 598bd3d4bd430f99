/**
 * AudioSink.hpp - Speaker capability interface
 */

#pragma once

#include <cstddef>

namespace parley::audio {

class AudioSink {
public:
    virtual ~AudioSink() = default;

    virtual void queuePlayback(const float* samples, size_t count) = 0;
    virtual void clearPlayback() = 0;
    virtual bool isPlaying() const = 0;

    // Samples queued but not yet played
    virtual size_t pendingSamples() const = 0;
    virtual int sampleRate() const = 0;
};

} // namespace parley::audio
