/**
 * SpeechPlayer.hpp - Streaming speech output
 *
 * Text arrives as whole utterances or as streamed fragments. Fragments are
 * coalesced into sentence-sized units, synthesized on a worker thread and
 * queued on the audio sink. The next unit is synthesized while the current
 * one plays.
 *
 * A stream opens with the first speakSentence()/speakStreaming() call and
 * closes on flush(). onSpeakingEnd fires once the stream is closed and all
 * audio has drained. stop() ends everything without an end event.
 */

#pragma once

#include "parley/Config.hpp"
#include "parley/audio/AudioSink.hpp"
#include "parley/tts/Synthesizer.hpp"

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace parley::tts {

struct PlayerCallbacks {
    std::function<void()> onSpeakingStart;
    std::function<void()> onSpeakingEnd;
    std::function<void(const std::string& reason)> onError;
};

class SpeechPlayer {
public:
    SpeechPlayer(std::shared_ptr<Synthesizer> synthesizer,
                 std::shared_ptr<audio::AudioSink> sink,
                 const TtsConfig& config = TtsConfig{});
    ~SpeechPlayer();

    SpeechPlayer(const SpeechPlayer&) = delete;
    SpeechPlayer& operator=(const SpeechPlayer&) = delete;

    void setCallbacks(PlayerCallbacks callbacks);

    /**
     * Cancel whatever is playing and speak `text` as a complete stream.
     */
    void speak(const std::string& text);

    /**
     * Append a complete sentence to the open stream.
     */
    void speakSentence(const std::string& sentence);

    /**
     * Append a fragment; it is spoken once a sentence boundary or the length cap is reached.
     */
    void speakStreaming(const std::string& fragment);

    /**
     * Speak any buffered fragment and close the stream.
     */
    void flush();

    /**
     * Drop queued and playing audio. Safe from any thread.
     */
    void stop();

    bool isSpeaking() const;

    /**
     * Cut complete units off the front of `pending`. A unit ends at ". ! ? ;"
     * followed by whitespace, at a newline, or near `max_chars` on a word boundary.
     */
    static std::vector<std::string> takeUtterances(std::string& pending, size_t max_chars);

    /**
     * Strip markdown markers and collapse whitespace.
     */
    static std::string cleanText(const std::string& text);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace parley::tts
