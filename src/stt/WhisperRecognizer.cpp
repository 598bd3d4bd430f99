/**
 * WhisperRecognizer.cpp - Streaming recognizer over STTEngine
 *
 * Each session carries a generation number. Results computed for a session
 * that has since been cancelled or replaced are dropped.
 */

#include "parley/stt/WhisperRecognizer.hpp"
#include "parley/stt/STTEngine.hpp"
#include "parley/audio/Wav.hpp"

#include <condition_variable>
#include <cstdint>
#include <iostream>
#include <mutex>
#include <thread>
#include <vector>

namespace parley::stt {

struct WhisperRecognizer::Impl {
    SttConfig config;
    int sample_rate;
    STTEngine engine;

    mutable std::mutex mutex;
    std::condition_variable cv;
    RecognizerCallbacks callbacks;

    std::vector<float> audio;       // Session audio at the engine rate
    size_t transcribedSamples = 0;  // Buffer size at the last partial
    uint64_t generation = 0;
    bool active = false;
    bool stopRequested = false;
    bool shutdown = false;

    std::thread worker;

    Impl(const SttConfig& cfg, int rate)
        : config(cfg)
        , sample_rate(rate)
        , engine(cfg) {}

    size_t partialIntervalSamples() const {
        return static_cast<size_t>(STTEngine::getSampleRate()) * config.partial_interval_ms / 1000;
    }

    // Called with the lock held
    bool partialDue() const {
        return config.partial_interval_ms > 0 &&
               audio.size() >= transcribedSamples + partialIntervalSamples();
    }

    void run() {
        std::unique_lock<std::mutex> lock(mutex);

        while (true) {
            cv.wait(lock, [this] {
                return shutdown || (active && (stopRequested || partialDue()));
            });
            if (shutdown) break;

            const uint64_t gen = generation;
            const bool isFinal = stopRequested;
            std::vector<float> snapshot = audio;
            transcribedSamples = audio.size();

            lock.unlock();
            std::string text;
            const bool ok = engine.transcribe(snapshot, text);
            lock.lock();

            if (gen != generation || !active) {
                continue;  // Cancelled or restarted while transcribing
            }

            // A partial that raced a stop request is superseded by the final pass
            if (!isFinal && stopRequested) {
                continue;
            }

            RecognizerCallbacks cb = callbacks;
            if (isFinal || !ok) {
                active = false;
                stopRequested = false;
                audio.clear();
                transcribedSamples = 0;
            }

            lock.unlock();
            if (!ok) {
                const std::string reason = engine.lastError();
                std::cerr << "[WhisperRecognizer] Transcription failed: " << reason << std::endl;
                if (cb.onError) cb.onError(reason);
            } else if (isFinal) {
                std::cout << "[WhisperRecognizer] Final (" << engine.lastInferenceMs() << "ms): \""
                          << text << "\"" << std::endl;
                if (cb.onFinal) cb.onFinal(text);
            } else if (!text.empty() && cb.onPartial) {
                cb.onPartial(text);
            }
            lock.lock();
        }
    }
};

WhisperRecognizer::WhisperRecognizer(const SttConfig& config, int sample_rate)
    : pImpl_(std::make_unique<Impl>(config, sample_rate)) {
    pImpl_->worker = std::thread([this] { pImpl_->run(); });
}

WhisperRecognizer::~WhisperRecognizer() {
    {
        std::lock_guard<std::mutex> lock(pImpl_->mutex);
        pImpl_->shutdown = true;
    }
    pImpl_->cv.notify_all();
    if (pImpl_->worker.joinable()) {
        pImpl_->worker.join();
    }
}

void WhisperRecognizer::setCallbacks(RecognizerCallbacks callbacks) {
    std::lock_guard<std::mutex> lock(pImpl_->mutex);
    pImpl_->callbacks = std::move(callbacks);
}

bool WhisperRecognizer::startRecognition() {
    if (!pImpl_->engine.isReady()) {
        RecognizerCallbacks cb;
        {
            std::lock_guard<std::mutex> lock(pImpl_->mutex);
            cb = pImpl_->callbacks;
        }
        std::cerr << "[WhisperRecognizer] Model not loaded: " << pImpl_->config.model_path << std::endl;
        if (cb.onError) cb.onError("speech recognition model not loaded");
        return false;
    }

    std::lock_guard<std::mutex> lock(pImpl_->mutex);
    ++pImpl_->generation;
    pImpl_->active = true;
    pImpl_->stopRequested = false;
    pImpl_->audio.clear();
    pImpl_->transcribedSamples = 0;
    return true;
}

void WhisperRecognizer::appendAudio(const float* samples, size_t count) {
    std::vector<float> converted;
    if (pImpl_->sample_rate != STTEngine::getSampleRate()) {
        converted = audio::resample(std::vector<float>(samples, samples + count),
                                    pImpl_->sample_rate, STTEngine::getSampleRate());
        samples = converted.data();
        count = converted.size();
    }

    bool notify = false;
    {
        std::lock_guard<std::mutex> lock(pImpl_->mutex);
        if (!pImpl_->active || pImpl_->stopRequested) {
            return;
        }
        pImpl_->audio.insert(pImpl_->audio.end(), samples, samples + count);
        notify = pImpl_->partialDue();
    }
    if (notify) {
        pImpl_->cv.notify_all();
    }
}

void WhisperRecognizer::stopRecognition() {
    {
        std::lock_guard<std::mutex> lock(pImpl_->mutex);
        if (!pImpl_->active || pImpl_->stopRequested) {
            return;
        }
        pImpl_->stopRequested = true;
    }
    pImpl_->cv.notify_all();
}

void WhisperRecognizer::cancelRecognition() {
    std::lock_guard<std::mutex> lock(pImpl_->mutex);
    ++pImpl_->generation;
    pImpl_->active = false;
    pImpl_->stopRequested = false;
    pImpl_->audio.clear();
    pImpl_->transcribedSamples = 0;
}

bool WhisperRecognizer::isActive() const {
    std::lock_guard<std::mutex> lock(pImpl_->mutex);
    return pImpl_->active;
}

bool WhisperRecognizer::isReady() const {
    return pImpl_->engine.isReady();
}

} // namespace parley::stt
