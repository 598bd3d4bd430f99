/**
 * Orchestrator.cpp - Conversation runtime
 *
 * Connects: AudioSource -> VAD -> Recognizer -> Transport -> SpeechPlayer -> AudioSink
 *
 * Threads:
 *   capture thread   level meter, VAD, recognizer feed (gated by state)
 *   event thread     state machine and effect execution
 *   component threads (recognizer, player, transport) only post events
 */

#include "parley/Orchestrator.hpp"
#include "parley/audio/AudioEngine.hpp"
#include "parley/audio/LevelMonitor.hpp"
#include "parley/audio/VADProcessor.hpp"
#include "parley/stt/WhisperRecognizer.hpp"
#include "parley/transport/TransportClient.hpp"
#include "parley/transport/WebSocketConnection.hpp"
#include "parley/tts/HttpSynthesizer.hpp"
#include "parley/tts/SpeechPlayer.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <iostream>
#include <mutex>
#include <optional>
#include <thread>

namespace parley {

namespace {

int64_t nowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count();
}

bool isCapturing(const ConversationState& state) {
    return state.is(ConversationStateKind::Listening) || state.is(ConversationStateKind::Interrupted);
}

} // anonymous namespace

struct Orchestrator::Impl {
    Config config;
    Components parts;

    std::unique_ptr<audio::VADProcessor> vad;
    audio::LevelMonitor level;
    std::unique_ptr<tts::SpeechPlayer> player;
    std::unique_ptr<transport::TransportClient> transport;

    // Event thread only
    DialogueStateMachine machine;
    std::optional<std::string> heldText;  // Utterance waiting for the link to come back

    std::mutex queueMutex;
    std::condition_variable queueCv;
    std::deque<Event> queue;
    bool stopping = false;
    std::atomic<bool> running{false};
    std::thread eventThread;

    // Published after every transition
    mutable std::mutex snapshotMutex;
    std::condition_variable stateCv;
    ConversationState state = ConversationState::idle();
    InputMode mode;
    std::vector<Message> messages;
    std::string partial;

    std::mutex callbackMutex;
    OrchestratorCallbacks callbacks;

    std::atomic<bool> captureOpen{false};
    std::atomic<int64_t> resumeAt{0};  // SpeechStart before this instant is echo tail

    Impl(const Config& cfg, Components components)
        : config(cfg)
        , parts(std::move(components))
        , machine(cfg.conversation)
        , mode(cfg.conversation.input_mode) {

        vad = std::make_unique<audio::VADProcessor>(config.vad, config.audio.sample_rate);
        player = std::make_unique<tts::SpeechPlayer>(parts.synthesizer, parts.sink, config.tts);
        transport = std::make_unique<transport::TransportClient>(
            parts.connectionFactory, config.server_url, config.transport);
    }

    OrchestratorCallbacks callbacksCopy() {
        std::lock_guard<std::mutex> lock(callbackMutex);
        return callbacks;
    }

    void post(Event event) {
        {
            std::lock_guard<std::mutex> lock(queueMutex);
            queue.push_back(std::move(event));
        }
        queueCv.notify_one();
    }

    void wire() {
        parts.source->setInputCallback([this](const float* samples, size_t count) {
            onAudio(samples, count);
        });

        vad->setEventCallback([this](const audio::VadEvent& event) {
            switch (event.type) {
                case audio::VadEventType::SpeechStart:
                    if (nowMs() < resumeAt.load()) {
                        // Echo tail. Start over so speech that keeps going triggers again
                        vad->reset();
                        return;
                    }
                    post(Event{EventType::SpeechStart});
                    break;
                case audio::VadEventType::SpeechEnd:
                    post(Event{EventType::SpeechEnd, {}, event.duration_ms});
                    break;
                case audio::VadEventType::SpeechDiscarded:
                    post(Event{EventType::SpeechDiscarded, {}, event.duration_ms});
                    break;
            }
        });

        vad->setCalibrationCallback([this](float progress, bool finished) {
            auto cb = callbacksCopy();
            if (cb.onCalibrationProgress) cb.onCalibrationProgress(progress, finished);
        });

        parts.recognizer->setCallbacks(stt::RecognizerCallbacks{
            [this](const std::string& text) { post(Event{EventType::PartialTranscript, text}); },
            [this](const std::string& text) { post(Event{EventType::FinalTranscript, text}); },
            [this](const std::string& reason) { post(Event{EventType::RecognitionFailed, reason}); }
        });

        player->setCallbacks(tts::PlayerCallbacks{
            [this] { post(Event{EventType::SpeakingStarted}); },
            [this] { post(Event{EventType::SpeakingFinished}); },
            [this](const std::string& reason) { post(Event{EventType::SynthesisFailed, reason}); }
        });

        transport::TransportCallbacks tc;
        tc.onMessage = [this](const transport::ServerMessage& message) { onServerMessage(message); };
        tc.onConnected = [this] { post(Event{EventType::TransportConnected}); };
        tc.onError = [this](const Error& error, bool fatal) {
            if (fatal) {
                post(Event{EventType::TransportFailed, error.message});
            }
        };
        transport->setCallbacks(std::move(tc));
    }

    void unwire() {
        parts.source->setInputCallback(nullptr);
        parts.recognizer->setCallbacks({});
        player->setCallbacks({});
        transport->setCallbacks({});
        vad->setEventCallback(nullptr);
        vad->setCalibrationCallback(nullptr);
    }

    // Capture thread
    void onAudio(const float* samples, size_t count) {
        level.process(samples, count);
        vad->process(samples, count);
        if (captureOpen.load()) {
            parts.recognizer->appendAudio(samples, count);
        }
    }

    // Transport supervisor thread
    void onServerMessage(const transport::ServerMessage& message) {
        using transport::ServerMessageType;
        switch (message.type) {
            case ServerMessageType::TextStart: post(Event{EventType::TextStart}); break;
            case ServerMessageType::TextDelta: post(Event{EventType::TextDelta, message.text}); break;
            case ServerMessageType::SentenceEnd: post(Event{EventType::SentenceEnd, message.text}); break;
            case ServerMessageType::TextDone: post(Event{EventType::TextDone, message.text}); break;
            case ServerMessageType::Interrupted: post(Event{EventType::ServerInterrupted}); break;
            case ServerMessageType::Error: post(Event{EventType::ServerError, message.text}); break;
            case ServerMessageType::Cleared: post(Event{EventType::Cleared, message.session_id}); break;
            case ServerMessageType::Pong:
            case ServerMessageType::Unknown:
                break;
        }
    }

    void run() {
        while (true) {
            Event event;
            {
                std::unique_lock<std::mutex> lock(queueMutex);
                queueCv.wait(lock, [this] { return stopping || !queue.empty(); });
                if (queue.empty()) break;
                event = std::move(queue.front());
                queue.pop_front();
            }
            dispatch(event);
        }
    }

    void dispatch(const Event& event) {
        const ConversationState before = machine.state();
        const size_t knownMessages = machine.messages().size();
        const std::string partialBefore = machine.utterance().partial_text;

        const std::vector<Effect> effects = machine.handle(event);
        for (const auto& effect : effects) {
            execute(effect);
        }
        if (event.type == EventType::TransportConnected) {
            releaseHeldText();
        }

        const ConversationState& after = machine.state();
        captureOpen = isCapturing(after);

        {
            std::lock_guard<std::mutex> lock(snapshotMutex);
            state = after;
            mode = machine.inputMode();
            messages = machine.messages();
            partial = machine.utterance().partial_text;
        }
        stateCv.notify_all();

        auto cb = callbacksCopy();
        if (after != before) {
            std::cout << "[Orchestrator] " << describe(before) << " -> " << describe(after)
                      << " (" << toString(event.type) << ")" << std::endl;
            if (cb.onStateChange) cb.onStateChange(after);
        }

        const auto& history = machine.messages();
        for (size_t i = knownMessages; i < history.size(); ++i) {
            const Message& message = history[i];
            if (message.role == Message::Role::User) {
                std::cout << "[Orchestrator] User: " << message.content << std::endl;
                if (cb.onUserUtterance) cb.onUserUtterance(message.content);
            } else {
                std::cout << "[Orchestrator] Assistant: " << message.content << std::endl;
                if (cb.onAssistantResponse) cb.onAssistantResponse(message.content);
            }
        }

        const std::string& partialAfter = machine.utterance().partial_text;
        if (!partialAfter.empty() && partialAfter != partialBefore && cb.onPartialTranscript) {
            cb.onPartialTranscript(partialAfter);
        }
    }

    void execute(const Effect& effect) {
        std::string error;

        switch (effect.type) {
            case EffectType::StartRecognition:
                parts.recognizer->startRecognition();
                break;

            case EffectType::StopRecognition:
                parts.recognizer->stopRecognition();
                break;

            case EffectType::CancelRecognition:
                parts.recognizer->cancelRecognition();
                break;

            case EffectType::SendText:
                sendOrHold(effect.text);
                break;

            case EffectType::SendInterrupt:
                heldText.reset();
                transport->sendInterrupt();
                break;

            case EffectType::SendClear:
                if (!transport->sendClear(error)) {
                    std::cerr << "[Orchestrator] Clear not delivered: " << error << std::endl;
                }
                break;

            case EffectType::NewSession:
                transport->newSession();
                break;

            case EffectType::EnqueueSentence:
                player->speakSentence(effect.text);
                break;

            case EffectType::FlushSpeech:
                player->flush();
                break;

            case EffectType::StopSpeech:
                player->stop();
                break;

            case EffectType::SetVadSpeakingMode:
                vad->setSpeakingMode(effect.flag);
                break;

            case EffectType::ResumeListening:
                resumeAt = nowMs() + effect.delay_ms;
                vad->reset();
                break;

            case EffectType::StartAudio:
                startAudio();
                break;

            case EffectType::HaltAudio:
                heldText.reset();
                player->stop();
                parts.recognizer->cancelRecognition();
                parts.source->stop();
                parts.sink->clearPlayback();
                vad->setSpeakingMode(false);
                vad->cancelCalibration();
                vad->reset();
                break;

            case EffectType::ConnectTransport:
                transport->connect();
                break;

            case EffectType::DisconnectTransport:
                heldText.reset();
                transport->disconnect();
                break;

            case EffectType::StartCalibration:
                vad->startCalibration(config.vad.calibration_ms);
                break;

            case EffectType::CancelCalibration:
                vad->cancelCalibration();
                break;

            case EffectType::ReportError: {
                std::cerr << "[Orchestrator] " << toString(effect.error) << ": " << effect.text << std::endl;
                auto cb = callbacksCopy();
                if (cb.onError) cb.onError(Error{effect.error, effect.text});
                break;
            }
        }
    }

    bool linkRecovering() const {
        const transport::ConnectionState link = transport->state();
        return link == transport::ConnectionState::Connecting ||
               link == transport::ConnectionState::Reconnecting;
    }

    // A dropped link is retried by the transport; the turn only fails once it gives up
    void sendOrHold(const std::string& text) {
        heldText.reset();
        std::string error;
        if (!linkRecovering() && transport->sendText(text, error)) {
            return;
        }
        if (linkRecovering()) {
            std::cout << "[Orchestrator] Transport " << transport::toString(transport->state())
                      << ", holding message until connected" << std::endl;
            heldText = text;
            return;
        }
        post(Event{EventType::SendFailed, "could not send message: " + error});
    }

    void releaseHeldText() {
        if (!heldText) return;
        std::string text = std::move(*heldText);
        heldText.reset();
        if (!machine.state().is(ConversationStateKind::Processing)) {
            return;
        }
        std::cout << "[Orchestrator] Transport connected, sending held message" << std::endl;
        sendOrHold(text);
    }

    void startAudio() {
        vad->reset();

        if (!parts.source->isRunning() && !parts.source->start()) {
            post(Event{EventType::RecognitionFailed, "audio capture unavailable"});
            return;
        }

        if (config.vad.auto_calibrate && !vad->isCalibrated()) {
            vad->startCalibration(config.vad.auto_calibration_ms);
        }
    }
};

Orchestrator::Orchestrator(const Config& config, Components components)
    : impl_(std::make_unique<Impl>(config, std::move(components))) {
    impl_->wire();
}

Orchestrator::~Orchestrator() {
    stop();
    impl_->unwire();
    // Join component threads while the runtime is still alive
    impl_->player.reset();
    impl_->transport.reset();
}

std::unique_ptr<Orchestrator> Orchestrator::createDefault(const Config& config) {
    auto engine = std::make_shared<audio::AudioEngine>(config.audio);

    Components components;
    components.source = engine;
    components.sink = engine;
    components.recognizer = std::make_shared<stt::WhisperRecognizer>(config.stt, config.audio.sample_rate);
    components.synthesizer = std::make_shared<tts::HttpSynthesizer>(config.tts);

    const int timeout_ms = config.transport.connect_timeout_ms;
    components.connectionFactory = [timeout_ms]() -> std::unique_ptr<transport::Connection> {
        return std::make_unique<transport::WebSocketConnection>(timeout_ms);
    };

    return std::make_unique<Orchestrator>(config, std::move(components));
}

bool Orchestrator::start() {
    if (impl_->running.exchange(true)) {
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(impl_->queueMutex);
        impl_->stopping = false;
    }
    impl_->eventThread = std::thread([this] { impl_->run(); });
    impl_->post(Event{EventType::StartConversation});
    std::cout << "[Orchestrator] Running (" << toString(impl_->config.conversation.input_mode) << ")" << std::endl;
    return true;
}

void Orchestrator::stop() {
    if (!impl_->running) {
        return;
    }
    impl_->post(Event{EventType::StopConversation});
    {
        std::lock_guard<std::mutex> lock(impl_->queueMutex);
        impl_->stopping = true;
    }
    impl_->queueCv.notify_all();
    if (impl_->eventThread.joinable()) {
        impl_->eventThread.join();
    }
    impl_->running = false;
    std::cout << "[Orchestrator] Stopped" << std::endl;
}

bool Orchestrator::isRunning() const {
    return impl_->running;
}

void Orchestrator::pushToTalkPress() { impl_->post(Event{EventType::PushToTalkPressed}); }
void Orchestrator::pushToTalkRelease() { impl_->post(Event{EventType::PushToTalkReleased}); }

void Orchestrator::setInputMode(InputMode mode) {
    Event event{EventType::SetInputMode};
    event.mode = mode;
    impl_->post(std::move(event));
}

void Orchestrator::clearHistory() { impl_->post(Event{EventType::ClearHistory}); }
void Orchestrator::restart() { impl_->post(Event{EventType::Restart}); }
void Orchestrator::startCalibration() { impl_->post(Event{EventType::StartCalibration}); }
void Orchestrator::cancelCalibration() { impl_->post(Event{EventType::CancelCalibration}); }
void Orchestrator::interrupt() { impl_->post(Event{EventType::ManualInterrupt}); }

ConversationState Orchestrator::state() const {
    std::lock_guard<std::mutex> lock(impl_->snapshotMutex);
    return impl_->state;
}

InputMode Orchestrator::inputMode() const {
    std::lock_guard<std::mutex> lock(impl_->snapshotMutex);
    return impl_->mode;
}

std::vector<Message> Orchestrator::messages() const {
    std::lock_guard<std::mutex> lock(impl_->snapshotMutex);
    return impl_->messages;
}

std::string Orchestrator::partialTranscript() const {
    std::lock_guard<std::mutex> lock(impl_->snapshotMutex);
    return impl_->partial;
}

float Orchestrator::audioLevel() const {
    return impl_->level.level();
}

std::string Orchestrator::sessionId() const {
    return impl_->transport->sessionId();
}

void Orchestrator::setCallbacks(OrchestratorCallbacks callbacks) {
    std::lock_guard<std::mutex> lock(impl_->callbackMutex);
    impl_->callbacks = std::move(callbacks);
}

void Orchestrator::post(Event event) {
    impl_->post(std::move(event));
}

bool Orchestrator::waitForState(ConversationStateKind kind, int timeout_ms) {
    std::unique_lock<std::mutex> lock(impl_->snapshotMutex);
    return impl_->stateCv.wait_for(lock, std::chrono::milliseconds(timeout_ms), [this, kind] {
        return impl_->state.is(kind);
    });
}

} // namespace parley
