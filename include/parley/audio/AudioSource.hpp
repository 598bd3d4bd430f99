/**
 * AudioSource.hpp - Microphone capability interface
 */

#pragma once

#include <cstddef>
#include <functional>

namespace parley::audio {

using AudioCallback = std::function<void(const float* samples, size_t count)>;

class AudioSource {
public:
    virtual ~AudioSource() = default;

    virtual bool start() = 0;
    virtual void stop() = 0;
    virtual bool isRunning() const = 0;

    /**
     * Callback runs on the capture thread. Keep it short.
     */
    virtual void setInputCallback(AudioCallback callback) = 0;
};

} // namespace parley::audio
