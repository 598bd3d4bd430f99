/**
 * STTEngine.hpp - Offline transcription with whisper.cpp
 */

#pragma once

#include "parley/Config.hpp"

#include <memory>
#include <string>
#include <vector>

namespace parley::stt {

class STTEngine {
public:
    explicit STTEngine(const SttConfig& config);
    ~STTEngine();

    STTEngine(STTEngine&& other) noexcept;
    STTEngine(const STTEngine&) = delete;
    STTEngine& operator=(const STTEngine&) = delete;

    /**
     * Transcribe 16 kHz mono float audio. Returns false on engine failure
     * (see lastError()); silence yields true with an empty `text`.
     */
    bool transcribe(const std::vector<float>& audio, std::string& text);

    bool isReady() const;
    std::string getModelInfo() const;
    std::string lastError() const;

    /**
     * Duration of the last successful transcribe() call.
     */
    int lastInferenceMs() const;

    static int getSampleRate() { return 16000; }

    /**
     * Strip non-speech markers ("[BLANK_AUDIO]", "(music)") and surrounding whitespace.
     */
    static std::string cleanTranscript(const std::string& raw);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace parley::stt
