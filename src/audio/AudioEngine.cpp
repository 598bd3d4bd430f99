/**
 * AudioEngine.cpp - PortAudio capture and playback
 *
 * Input frames are handed to the registered callback on the PortAudio thread.
 * Output frames are drained from a lock-free ring buffer; underruns are zero-filled.
 */

#include "parley/audio/AudioEngine.hpp"
#include "parley/audio/RingBuffer.hpp"

#include <portaudio.h>

#include <atomic>
#include <cstring>
#include <iostream>
#include <mutex>

namespace parley::audio {

namespace {

constexpr int PLAYBACK_SECONDS = 30;

int onInput(const void* input, void* output, unsigned long frameCount,
            const PaStreamCallbackTimeInfo* timeInfo, PaStreamCallbackFlags statusFlags,
            void* userData);

int onOutput(const void* input, void* output, unsigned long frameCount,
             const PaStreamCallbackTimeInfo* timeInfo, PaStreamCallbackFlags statusFlags,
             void* userData);

std::vector<std::string> listDevices(bool input) {
    std::vector<std::string> devices;

    if (Pa_Initialize() != paNoError) {
        return devices;
    }

    const int count = Pa_GetDeviceCount();
    for (int i = 0; i < count; ++i) {
        const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
        if (!info) continue;
        const int channels = input ? info->maxInputChannels : info->maxOutputChannels;
        if (channels > 0) {
            devices.emplace_back(info->name);
        }
    }

    Pa_Terminate();
    return devices;
}

struct EngineState {
    PaStream* inputStream = nullptr;
    PaStream* outputStream = nullptr;

    AudioCallback userCallback;
    std::mutex callbackMutex;

    RingBuffer<float> playback;

    std::atomic<bool> running{false};
    bool initialized = false;
    std::string lastError;

    explicit EngineState(size_t playback_samples) : playback(playback_samples) {}

    void fail(const std::string& what, PaError err) {
        lastError = what + ": " + Pa_GetErrorText(err);
        std::cerr << "[AudioEngine] " << lastError << std::endl;
    }

    void closeStreams() {
        if (inputStream) {
            Pa_StopStream(inputStream);
            Pa_CloseStream(inputStream);
            inputStream = nullptr;
        }
        if (outputStream) {
            Pa_StopStream(outputStream);
            Pa_CloseStream(outputStream);
            outputStream = nullptr;
        }
    }

    bool openStream(PaStream** stream, bool input, const AudioConfig& config) {
        PaStreamParameters params;
        const int requested = input ? config.input_device : config.output_device;
        params.device = requested >= 0
            ? requested
            : (input ? Pa_GetDefaultInputDevice() : Pa_GetDefaultOutputDevice());

        if (params.device == paNoDevice) {
            lastError = input ? "No input device available" : "No output device available";
            std::cerr << "[AudioEngine] " << lastError << std::endl;
            return false;
        }

        const PaDeviceInfo* info = Pa_GetDeviceInfo(params.device);
        params.channelCount = config.channels;
        params.sampleFormat = paFloat32;
        params.suggestedLatency = input ? info->defaultLowInputLatency : info->defaultLowOutputLatency;
        params.hostApiSpecificStreamInfo = nullptr;

        PaError err = Pa_OpenStream(
            stream,
            input ? &params : nullptr,
            input ? nullptr : &params,
            config.sample_rate,
            config.frames_per_buffer,
            paClipOff,
            input ? onInput : onOutput,
            this
        );

        if (err != paNoError) {
            fail(input ? "Pa_OpenStream (input) failed" : "Pa_OpenStream (output) failed", err);
            return false;
        }

        std::cout << "[AudioEngine] " << (input ? "Input: " : "Output: ") << info->name << std::endl;
        return true;
    }
};

int onInput(const void* input, void* /*output*/, unsigned long frameCount,
            const PaStreamCallbackTimeInfo* /*timeInfo*/, PaStreamCallbackFlags /*statusFlags*/,
            void* userData) {
    auto* impl = static_cast<EngineState*>(userData);
    const auto* samples = static_cast<const float*>(input);

    std::lock_guard<std::mutex> lock(impl->callbackMutex);
    if (impl->userCallback && samples) {
        impl->userCallback(samples, frameCount);
    }
    return paContinue;
}

int onOutput(const void* /*input*/, void* output, unsigned long frameCount,
             const PaStreamCallbackTimeInfo* /*timeInfo*/, PaStreamCallbackFlags /*statusFlags*/,
             void* userData) {
    auto* impl = static_cast<EngineState*>(userData);
    auto* out = static_cast<float*>(output);

    const size_t read = impl->playback.pop(out, frameCount);
    if (read < frameCount) {
        std::memset(out + read, 0, (frameCount - read) * sizeof(float));
    }
    return paContinue;
}

} // anonymous namespace

struct AudioEngine::Impl : EngineState {
    using EngineState::EngineState;
};

AudioEngine::AudioEngine(const AudioConfig& config)
    : pImpl_(std::make_unique<Impl>(static_cast<size_t>(config.sample_rate) * PLAYBACK_SECONDS))
    , config_(config) {
}

AudioEngine::~AudioEngine() {
    stop();
    if (pImpl_->initialized) {
        Pa_Terminate();
    }
}

bool AudioEngine::initialize() {
    if (pImpl_->initialized) {
        return true;
    }

    PaError err = Pa_Initialize();
    if (err != paNoError) {
        pImpl_->fail("Pa_Initialize failed", err);
        return false;
    }

    pImpl_->initialized = true;
    std::cout << "[AudioEngine] Found " << Pa_GetDeviceCount() << " audio devices" << std::endl;
    return true;
}

bool AudioEngine::start() {
    if (pImpl_->running) {
        return true;
    }
    if (!initialize()) {
        return false;
    }

    if (!pImpl_->openStream(&pImpl_->inputStream, true, config_) ||
        !pImpl_->openStream(&pImpl_->outputStream, false, config_)) {
        pImpl_->closeStreams();
        return false;
    }

    PaError err = Pa_StartStream(pImpl_->inputStream);
    if (err == paNoError) {
        err = Pa_StartStream(pImpl_->outputStream);
    }
    if (err != paNoError) {
        pImpl_->fail("Pa_StartStream failed", err);
        pImpl_->closeStreams();
        return false;
    }

    pImpl_->running = true;
    std::cout << "[AudioEngine] Started (sample_rate=" << config_.sample_rate
              << "Hz, buffer=" << config_.frames_per_buffer << " frames)" << std::endl;
    return true;
}

void AudioEngine::stop() {
    if (!pImpl_->running.exchange(false)) {
        return;
    }
    pImpl_->closeStreams();
    pImpl_->playback.clear();
    std::cout << "[AudioEngine] Stopped" << std::endl;
}

bool AudioEngine::isRunning() const {
    return pImpl_->running;
}

void AudioEngine::setInputCallback(AudioCallback callback) {
    std::lock_guard<std::mutex> lock(pImpl_->callbackMutex);
    pImpl_->userCallback = std::move(callback);
}

void AudioEngine::queuePlayback(const float* samples, size_t count) {
    const size_t queued = pImpl_->playback.push(samples, count);
    if (queued < count) {
        std::cerr << "[AudioEngine] Playback buffer full, dropped " << (count - queued)
                  << " samples" << std::endl;
    }
}

void AudioEngine::clearPlayback() {
    pImpl_->playback.clear();
}

bool AudioEngine::isPlaying() const {
    return pImpl_->running && pImpl_->playback.available() > 0;
}

size_t AudioEngine::pendingSamples() const {
    return pImpl_->playback.available();
}

std::string AudioEngine::lastError() const {
    return pImpl_->lastError;
}

std::vector<std::string> AudioEngine::listInputDevices() {
    return listDevices(true);
}

std::vector<std::string> AudioEngine::listOutputDevices() {
    return listDevices(false);
}

} // namespace parley::audio
