/**
 * Recognizer.hpp - Streaming speech recognizer capability
 *
 * One recognition session at a time. Partial results may arrive any number of
 * times; exactly one of onFinal / onError ends a session that was not cancelled.
 */

#pragma once

#include <cstddef>
#include <functional>
#include <string>

namespace parley::stt {

struct RecognizerCallbacks {
    std::function<void(const std::string& text)> onPartial;
    std::function<void(const std::string& text)> onFinal;
    std::function<void(const std::string& reason)> onError;
};

class Recognizer {
public:
    virtual ~Recognizer() = default;

    virtual void setCallbacks(RecognizerCallbacks callbacks) = 0;

    /**
     * Open a session. Returns false (and fires onError) if the engine is unavailable.
     */
    virtual bool startRecognition() = 0;

    /**
     * Ignored unless a session is open.
     */
    virtual void appendAudio(const float* samples, size_t count) = 0;

    /**
     * Close the session and produce the final transcript.
     */
    virtual void stopRecognition() = 0;

    /**
     * Drop the session without a result. Never reports an error.
     */
    virtual void cancelRecognition() = 0;

    virtual bool isActive() const = 0;
};

} // namespace parley::stt
