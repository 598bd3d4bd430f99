/**
 * Orchestrator.hpp - Conversation runtime
 *
 * Owns one conversation: wires capture, endpointer, recognizer, transport and
 * player to a DialogueStateMachine. Every component reports through post();
 * a single event thread applies the transitions and executes their effects.
 */

#pragma once

#include "parley/Config.hpp"
#include "parley/DialogueStateMachine.hpp"
#include "parley/Types.hpp"
#include "parley/audio/AudioSink.hpp"
#include "parley/audio/AudioSource.hpp"
#include "parley/stt/Recognizer.hpp"
#include "parley/transport/Connection.hpp"
#include "parley/tts/Synthesizer.hpp"

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace parley {

struct OrchestratorCallbacks {
    std::function<void(const ConversationState& state)> onStateChange;
    std::function<void(const std::string& text)> onUserUtterance;
    std::function<void(const std::string& text)> onAssistantResponse;
    std::function<void(const std::string& text)> onPartialTranscript;
    std::function<void(const Error& error)> onError;
    std::function<void(float progress, bool finished)> onCalibrationProgress;
};

/**
 * Capability implementations the runtime drives. `source` and `sink` may be the same object.
 */
struct Components {
    std::shared_ptr<audio::AudioSource> source;
    std::shared_ptr<audio::AudioSink> sink;
    std::shared_ptr<stt::Recognizer> recognizer;
    std::shared_ptr<tts::Synthesizer> synthesizer;
    transport::ConnectionFactory connectionFactory;
};

class Orchestrator {
public:
    Orchestrator(const Config& config, Components components);
    ~Orchestrator();

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    /**
     * PortAudio capture/playback, whisper.cpp recognition, HTTP synthesis, WebSocket transport.
     */
    static std::unique_ptr<Orchestrator> createDefault(const Config& config);

    /**
     * Start the event thread and the conversation. Returns false if already running.
     */
    bool start();

    /**
     * End the conversation and join the event thread. Safe to call twice.
     */
    void stop();
    bool isRunning() const;

    // User controls
    void pushToTalkPress();
    void pushToTalkRelease();
    void setInputMode(InputMode mode);
    void clearHistory();
    void restart();
    void startCalibration();
    void cancelCalibration();

    /**
     * Stop the current response. Never fails.
     */
    void interrupt();

    // Observers
    ConversationState state() const;
    InputMode inputMode() const;
    std::vector<Message> messages() const;
    std::string partialTranscript() const;
    float audioLevel() const;
    std::string sessionId() const;

    void setCallbacks(OrchestratorCallbacks callbacks);

    /**
     * Queue an event for the state machine. Callable from any thread.
     */
    void post(Event event);

    /**
     * Block until the state reaches `kind` or the timeout expires.
     */
    bool waitForState(ConversationStateKind kind, int timeout_ms);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace parley
