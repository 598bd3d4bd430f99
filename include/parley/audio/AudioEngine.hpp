/**
 * AudioEngine.hpp - PortAudio capture and playback
 *
 * Implements both capability interfaces over one duplex device pair.
 */

#pragma once

#include "parley/Config.hpp"
#include "parley/audio/AudioSink.hpp"
#include "parley/audio/AudioSource.hpp"

#include <memory>
#include <string>
#include <vector>

namespace parley::audio {

class AudioEngine : public AudioSource, public AudioSink {
public:
    explicit AudioEngine(const AudioConfig& config = AudioConfig{});
    ~AudioEngine() override;

    AudioEngine(const AudioEngine&) = delete;
    AudioEngine& operator=(const AudioEngine&) = delete;

    bool initialize();

    // AudioSource
    bool start() override;
    void stop() override;
    bool isRunning() const override;
    void setInputCallback(AudioCallback callback) override;

    // AudioSink
    void queuePlayback(const float* samples, size_t count) override;
    void clearPlayback() override;
    bool isPlaying() const override;
    size_t pendingSamples() const override;
    int sampleRate() const override { return config_.sample_rate; }

    std::string lastError() const;

    static std::vector<std::string> listInputDevices();
    static std::vector<std::string> listOutputDevices();

private:
    struct Impl;
    std::unique_ptr<Impl> pImpl_;
    AudioConfig config_;
};

} // namespace parley::audio
