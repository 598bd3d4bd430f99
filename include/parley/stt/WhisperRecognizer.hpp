/**
 * WhisperRecognizer.hpp - Streaming recognizer over STTEngine
 *
 * Audio is accumulated per session; a worker thread transcribes the growing
 * buffer for partial results and the whole buffer once the session is stopped.
 */

#pragma once

#include "parley/Config.hpp"
#include "parley/stt/Recognizer.hpp"

#include <memory>

namespace parley::stt {

class WhisperRecognizer : public Recognizer {
public:
    /**
     * @param sample_rate rate of the audio passed to appendAudio()
     */
    explicit WhisperRecognizer(const SttConfig& config, int sample_rate = 16000);
    ~WhisperRecognizer() override;

    WhisperRecognizer(const WhisperRecognizer&) = delete;
    WhisperRecognizer& operator=(const WhisperRecognizer&) = delete;

    void setCallbacks(RecognizerCallbacks callbacks) override;
    bool startRecognition() override;
    void appendAudio(const float* samples, size_t count) override;
    void stopRecognition() override;
    void cancelRecognition() override;
    bool isActive() const override;

    bool isReady() const;

private:
    struct Impl;
    std::unique_ptr<Impl> pImpl_;
};

} // namespace parley::stt
