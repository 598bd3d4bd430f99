/**
 * DialogueStateMachine.hpp - Turn-taking logic
 *
 * Pure transition function: handle(event) updates the conversation state and
 * returns the side effects the runtime must execute, in order. No I/O, no
 * threads, no clocks other than the injected one used for message timestamps.
 */

#pragma once

#include "parley/Config.hpp"
#include "parley/Types.hpp"

#include <chrono>
#include <functional>
#include <string>
#include <vector>

namespace parley {

enum class EventType {
    // Lifecycle and user controls
    StartConversation,
    StopConversation,
    Restart,
    ClearHistory,
    SetInputMode,
    PushToTalkPressed,
    PushToTalkReleased,
    ManualInterrupt,
    StartCalibration,
    CancelCalibration,

    // Endpointer
    SpeechStart,
    SpeechEnd,
    SpeechDiscarded,

    // Recognizer
    PartialTranscript,
    FinalTranscript,
    RecognitionFailed,

    // Transport
    TransportConnected,
    TextStart,
    TextDelta,
    SentenceEnd,
    TextDone,
    ServerInterrupted,
    ServerError,
    SendFailed,
    TransportFailed,
    Cleared,

    // Player
    SpeakingStarted,
    SpeakingFinished,
    SynthesisFailed
};

const char* toString(EventType type);

struct Event {
    EventType type;
    std::string text;     // Transcript, delta, sentence, full text or error reason
    int duration_ms = 0;  // SpeechEnd
    InputMode mode = InputMode::HandsFree;  // SetInputMode
};

enum class EffectType {
    StartRecognition,
    StopRecognition,
    CancelRecognition,
    SendText,
    SendInterrupt,
    SendClear,
    NewSession,
    EnqueueSentence,
    FlushSpeech,
    StopSpeech,
    SetVadSpeakingMode,
    ResumeListening,
    StartAudio,
    HaltAudio,
    ConnectTransport,
    DisconnectTransport,
    StartCalibration,
    CancelCalibration,
    ReportError
};

const char* toString(EffectType type);

struct Effect {
    EffectType type;
    std::string text;       // SendText, EnqueueSentence, ReportError
    bool flag = false;      // SetVadSpeakingMode
    int delay_ms = 0;       // ResumeListening
    ErrorKind error = ErrorKind::Transport;  // ReportError

    bool operator==(const Effect& other) const {
        return type == other.type && text == other.text && flag == other.flag &&
               delay_ms == other.delay_ms && error == other.error;
    }
};

class DialogueStateMachine {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    explicit DialogueStateMachine(const ConversationConfig& config = ConversationConfig{},
                                  Clock clock = nullptr);

    std::vector<Effect> handle(const Event& event);

    const ConversationState& state() const { return state_; }
    InputMode inputMode() const { return mode_; }
    bool isActive() const { return active_; }

    const std::vector<Message>& messages() const { return messages_; }
    const Utterance& utterance() const { return utterance_; }

    /**
     * Assistant text received so far in the current turn.
     */
    const std::string& responseText() const { return response_; }

private:
    void onStart(std::vector<Effect>& fx);
    void onStop(std::vector<Effect>& fx);
    void onFinalTranscript(const std::string& text, std::vector<Effect>& fx);
    void onTextDone(const std::string& full_text, std::vector<Effect>& fx);
    void bargeIn(std::vector<Effect>& fx);
    void cutOffTurn(std::vector<Effect>& fx);
    void enterIdle(std::vector<Effect>& fx, bool resume);
    void enterSpeaking(std::vector<Effect>& fx);
    void enterError(const std::string& reason, ErrorKind kind, std::vector<Effect>& fx);
    void reportOrdering(const Event& event, std::vector<Effect>& fx);
    void addMessage(Message::Role role, std::string content);
    void resetTurn();

    bool isIn(ConversationStateKind kind) const { return state_.is(kind); }
    bool capturing() const;

    ConversationConfig config_;
    Clock clock_;

    ConversationState state_ = ConversationState::idle();
    InputMode mode_;
    bool active_ = false;

    Utterance utterance_;
    std::vector<Message> messages_;

    // Current assistant turn
    std::string response_;
    std::string spoken_;        // Sentences handed to the player
    bool turnStarted_ = false;  // text_start seen
    bool vadTurn_ = false;      // Capture opened by the endpointer, which also closes it
    bool responseRecorded_ = false;
};

} // namespace parley
