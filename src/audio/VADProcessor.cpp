/**
 * VADProcessor.cpp - Energy endpointer with libfvad confirmation
 *
 * A frame is voiced when its RMS clears the active threshold and, if libfvad
 * is enabled, the WebRTC classifier agrees. Speech starts after a sustained run
 * of voiced frames and ends after the silence timeout.
 */

#include "parley/audio/VADProcessor.hpp"
#include "parley/audio/LevelMonitor.hpp"

#include <fvad.h>

#include <algorithm>
#include <cmath>
#include <iostream>
#include <mutex>
#include <vector>

namespace parley::audio {

namespace {

constexpr float ABSOLUTE_MIN_THRESHOLD = 0.008f;
constexpr float ABSOLUTE_MAX_THRESHOLD = 0.15f;
constexpr float SPEECH_THRESHOLD_MULTIPLIER = 1.8f;

} // anonymous namespace

struct VADProcessor::Impl {
    VadConfig config;
    int sample_rate;
    int frame_samples;

    Fvad* fvad = nullptr;

    mutable std::mutex mutex;
    std::vector<float> frameBuffer;

    float threshold;
    float noiseFloor = 0.0f;
    bool calibrated = false;
    bool speakingMode = false;

    // Endpointing
    bool inSpeech = false;
    int runMs = 0;       // Consecutive voiced time before speech start
    int voicedMs = 0;    // Voiced time inside the current segment
    int silenceMs = 0;   // Trailing silence inside the current segment
    int segmentMs = 0;   // Total segment length

    // Calibration
    bool calibrating = false;
    int calibrationTargetMs = 0;
    int calibrationElapsedMs = 0;
    float progress = 0.0f;
    std::vector<float> calibrationSamples;

    VadCallback eventCallback;
    CalibrationCallback calibrationCallback;

    Impl(const VadConfig& cfg, int rate)
        : config(cfg)
        , sample_rate(rate)
        , frame_samples(rate * cfg.frame_ms / 1000)
        , threshold(cfg.threshold) {
        frameBuffer.reserve(frame_samples);
    }

    float activeThreshold() const {
        return speakingMode ? threshold * config.interrupt_threshold_scale : threshold;
    }

    void resetSegment() {
        inSpeech = false;
        runMs = 0;
        voicedMs = 0;
        silenceMs = 0;
        segmentMs = 0;
    }

    bool classify(const float* frame, float energy) {
        bool voiced = energy > activeThreshold();

        if (fvad) {
            std::vector<int16_t> frame16(frame_samples);
            for (int i = 0; i < frame_samples; ++i) {
                frame16[i] = static_cast<int16_t>(std::clamp(frame[i], -1.0f, 1.0f) * 32767.0f);
            }
            // Run on every frame so the classifier keeps its internal history
            const int result = fvad_process(fvad, frame16.data(), frame_samples);
            if (result < 0) {
                std::cerr << "[VADProcessor] fvad_process failed, using energy only" << std::endl;
                fvad_free(fvad);
                fvad = nullptr;
            } else {
                voiced = voiced && result == 1;
            }
        }

        return voiced;
    }

    // Returns true when calibration finished on this frame
    bool calibrate(float energy) {
        calibrationSamples.push_back(energy);
        calibrationElapsedMs += config.frame_ms;
        progress = std::min(1.0f, static_cast<float>(calibrationElapsedMs) / calibrationTargetMs);

        if (calibrationElapsedMs < calibrationTargetMs) {
            return false;
        }

        std::sort(calibrationSamples.begin(), calibrationSamples.end());
        const size_t idx = std::min(calibrationSamples.size() / 4, calibrationSamples.size() - 1);
        noiseFloor = std::max(ABSOLUTE_MIN_THRESHOLD / SPEECH_THRESHOLD_MULTIPLIER, calibrationSamples[idx]);
        threshold = std::clamp(noiseFloor * SPEECH_THRESHOLD_MULTIPLIER,
                               ABSOLUTE_MIN_THRESHOLD, ABSOLUTE_MAX_THRESHOLD);

        calibrationSamples.clear();
        calibrating = false;
        calibrated = true;
        progress = 1.0f;

        std::cout << "[VADProcessor] Calibrated: noise_floor=" << noiseFloor
                  << " threshold=" << threshold << std::endl;
        return true;
    }

    void endpoint(bool voiced, std::vector<VadEvent>& events) {
        const int frame_ms = config.frame_ms;

        if (!inSpeech) {
            if (!voiced) {
                runMs = 0;
                return;
            }
            runMs += frame_ms;
            if (runMs >= config.speech_start_ms) {
                inSpeech = true;
                voicedMs = runMs;
                segmentMs = runMs;
                silenceMs = 0;
                events.push_back({VadEventType::SpeechStart, 0});
            }
            return;
        }

        segmentMs += frame_ms;
        if (voiced) {
            voicedMs += frame_ms;
            silenceMs = 0;
        } else {
            silenceMs += frame_ms;
        }

        if (silenceMs >= config.silence_timeout_ms) {
            const int spoken = segmentMs - silenceMs;
            if (voicedMs >= config.min_speech_ms) {
                events.push_back({VadEventType::SpeechEnd, spoken});
            } else {
                events.push_back({VadEventType::SpeechDiscarded, spoken});
            }
            resetSegment();
        } else if (segmentMs >= config.max_speech_ms) {
            events.push_back({VadEventType::SpeechEnd, segmentMs});
            resetSegment();
        }
    }
};

VADProcessor::VADProcessor(const VadConfig& config, int sample_rate)
    : pImpl_(std::make_unique<Impl>(config, sample_rate)) {

    if (config.webrtc_mode < 0) {
        std::cout << "[VADProcessor] Energy-only mode (threshold=" << config.threshold << ")" << std::endl;
        return;
    }

    pImpl_->fvad = fvad_new();
    if (!pImpl_->fvad) {
        std::cerr << "[VADProcessor] Failed to create fvad instance, using energy only" << std::endl;
        return;
    }

    if (fvad_set_sample_rate(pImpl_->fvad, sample_rate) < 0 ||
        fvad_set_mode(pImpl_->fvad, config.webrtc_mode) < 0) {
        std::cerr << "[VADProcessor] Unsupported fvad settings (rate=" << sample_rate
                  << ", mode=" << config.webrtc_mode << "), using energy only" << std::endl;
        fvad_free(pImpl_->fvad);
        pImpl_->fvad = nullptr;
        return;
    }

    std::cout << "[VADProcessor] Initialized (sample_rate=" << sample_rate
              << "Hz, frame=" << config.frame_ms << "ms, webrtc_mode=" << config.webrtc_mode
              << ", threshold=" << config.threshold << ")" << std::endl;
}

VADProcessor::~VADProcessor() {
    if (pImpl_->fvad) {
        fvad_free(pImpl_->fvad);
    }
}

void VADProcessor::process(const float* samples, size_t count) {
    std::vector<VadEvent> events;
    bool calibrationFinished = false;
    bool calibrationTicked = false;
    float progress = 0.0f;
    VadCallback eventCallback;
    CalibrationCallback calibrationCallback;

    {
        std::lock_guard<std::mutex> lock(pImpl_->mutex);
        auto& impl = *pImpl_;

        for (size_t i = 0; i < count; ++i) {
            impl.frameBuffer.push_back(samples[i]);
            if (impl.frameBuffer.size() < static_cast<size_t>(impl.frame_samples)) {
                continue;
            }

            const float energy = LevelMonitor::rms(impl.frameBuffer.data(), impl.frameBuffer.size());

            if (impl.calibrating) {
                calibrationTicked = true;
                calibrationFinished = impl.calibrate(energy) || calibrationFinished;
                progress = impl.progress;
            } else {
                impl.endpoint(impl.classify(impl.frameBuffer.data(), energy), events);
            }

            impl.frameBuffer.clear();
        }

        eventCallback = impl.eventCallback;
        calibrationCallback = impl.calibrationCallback;
    }

    if (calibrationTicked && calibrationCallback) {
        calibrationCallback(progress, calibrationFinished);
    }
    if (eventCallback) {
        for (const auto& event : events) {
            eventCallback(event);
        }
    }
}

void VADProcessor::setEventCallback(VadCallback callback) {
    std::lock_guard<std::mutex> lock(pImpl_->mutex);
    pImpl_->eventCallback = std::move(callback);
}

void VADProcessor::setCalibrationCallback(CalibrationCallback callback) {
    std::lock_guard<std::mutex> lock(pImpl_->mutex);
    pImpl_->calibrationCallback = std::move(callback);
}

void VADProcessor::setSilenceTimeout(int timeout_ms) {
    std::lock_guard<std::mutex> lock(pImpl_->mutex);
    pImpl_->config.silence_timeout_ms = timeout_ms;
}

void VADProcessor::setMinSpeechDuration(int min_ms) {
    std::lock_guard<std::mutex> lock(pImpl_->mutex);
    pImpl_->config.min_speech_ms = min_ms;
}

void VADProcessor::setSpeakingMode(bool speaking) {
    std::lock_guard<std::mutex> lock(pImpl_->mutex);
    pImpl_->speakingMode = speaking;
}

void VADProcessor::startCalibration(int duration_ms) {
    std::lock_guard<std::mutex> lock(pImpl_->mutex);
    auto& impl = *pImpl_;
    impl.calibrating = true;
    impl.calibrationTargetMs = std::max(duration_ms, impl.config.frame_ms);
    impl.calibrationElapsedMs = 0;
    impl.progress = 0.0f;
    impl.calibrationSamples.clear();
    impl.frameBuffer.clear();
    impl.resetSegment();
    std::cout << "[VADProcessor] Calibrating for " << impl.calibrationTargetMs << "ms" << std::endl;
}

void VADProcessor::cancelCalibration() {
    std::lock_guard<std::mutex> lock(pImpl_->mutex);
    if (!pImpl_->calibrating) return;
    pImpl_->calibrating = false;
    pImpl_->progress = 0.0f;
    pImpl_->calibrationSamples.clear();
    std::cout << "[VADProcessor] Calibration cancelled" << std::endl;
}

bool VADProcessor::isCalibrating() const {
    std::lock_guard<std::mutex> lock(pImpl_->mutex);
    return pImpl_->calibrating;
}

bool VADProcessor::isCalibrated() const {
    std::lock_guard<std::mutex> lock(pImpl_->mutex);
    return pImpl_->calibrated;
}

float VADProcessor::calibrationProgress() const {
    std::lock_guard<std::mutex> lock(pImpl_->mutex);
    return pImpl_->progress;
}

float VADProcessor::threshold() const {
    std::lock_guard<std::mutex> lock(pImpl_->mutex);
    return pImpl_->threshold;
}

float VADProcessor::activeThreshold() const {
    std::lock_guard<std::mutex> lock(pImpl_->mutex);
    return pImpl_->activeThreshold();
}

float VADProcessor::noiseFloor() const {
    std::lock_guard<std::mutex> lock(pImpl_->mutex);
    return pImpl_->noiseFloor;
}

bool VADProcessor::isSpeaking() const {
    std::lock_guard<std::mutex> lock(pImpl_->mutex);
    return pImpl_->inSpeech;
}

int VADProcessor::currentSpeechDuration() const {
    std::lock_guard<std::mutex> lock(pImpl_->mutex);
    return pImpl_->inSpeech ? pImpl_->segmentMs : 0;
}

bool VADProcessor::hasWebRtcClassifier() const {
    std::lock_guard<std::mutex> lock(pImpl_->mutex);
    return pImpl_->fvad != nullptr;
}

void VADProcessor::reset() {
    std::lock_guard<std::mutex> lock(pImpl_->mutex);
    pImpl_->frameBuffer.clear();
    pImpl_->resetSegment();
    if (pImpl_->fvad) {
        fvad_reset(pImpl_->fvad);
        fvad_set_mode(pImpl_->fvad, pImpl_->config.webrtc_mode);
        fvad_set_sample_rate(pImpl_->fvad, pImpl_->sample_rate);
    }
}

} // namespace parley::audio
