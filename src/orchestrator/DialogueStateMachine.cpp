/**
 * DialogueStateMachine.cpp - Turn-taking logic
 *
 *   idle --speechStart/ptt--> listening --final--> processing --sentence--> speaking
 *     ^                          |                     |                       |
 *     +------ empty final -------+       error --------+     speechStart --> interrupted
 *     +------------------------------ player finished -------------------------+
 *
 * Events that have no meaning in the current state are ignored.
 */

#include "parley/DialogueStateMachine.hpp"

#include <cctype>
#include <iostream>

namespace parley {

namespace {

std::string trim(const std::string& s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(begin, end - begin);
}

Effect effect(EffectType type) {
    return Effect{type};
}

Effect effect(EffectType type, std::string text) {
    return Effect{type, std::move(text)};
}

} // anonymous namespace

const char* toString(EventType type) {
    switch (type) {
        case EventType::StartConversation: return "StartConversation";
        case EventType::StopConversation: return "StopConversation";
        case EventType::Restart: return "Restart";
        case EventType::ClearHistory: return "ClearHistory";
        case EventType::SetInputMode: return "SetInputMode";
        case EventType::PushToTalkPressed: return "PushToTalkPressed";
        case EventType::PushToTalkReleased: return "PushToTalkReleased";
        case EventType::ManualInterrupt: return "ManualInterrupt";
        case EventType::StartCalibration: return "StartCalibration";
        case EventType::CancelCalibration: return "CancelCalibration";
        case EventType::SpeechStart: return "SpeechStart";
        case EventType::SpeechEnd: return "SpeechEnd";
        case EventType::SpeechDiscarded: return "SpeechDiscarded";
        case EventType::PartialTranscript: return "PartialTranscript";
        case EventType::FinalTranscript: return "FinalTranscript";
        case EventType::RecognitionFailed: return "RecognitionFailed";
        case EventType::TransportConnected: return "TransportConnected";
        case EventType::TextStart: return "text_start";
        case EventType::TextDelta: return "text_delta";
        case EventType::SentenceEnd: return "sentence_end";
        case EventType::TextDone: return "text_done";
        case EventType::ServerInterrupted: return "interrupted";
        case EventType::ServerError: return "error";
        case EventType::SendFailed: return "SendFailed";
        case EventType::TransportFailed: return "TransportFailed";
        case EventType::Cleared: return "cleared";
        case EventType::SpeakingStarted: return "SpeakingStarted";
        case EventType::SpeakingFinished: return "SpeakingFinished";
        case EventType::SynthesisFailed: return "SynthesisFailed";
    }
    return "Unknown";
}

const char* toString(EffectType type) {
    switch (type) {
        case EffectType::StartRecognition: return "StartRecognition";
        case EffectType::StopRecognition: return "StopRecognition";
        case EffectType::CancelRecognition: return "CancelRecognition";
        case EffectType::SendText: return "SendText";
        case EffectType::SendInterrupt: return "SendInterrupt";
        case EffectType::SendClear: return "SendClear";
        case EffectType::NewSession: return "NewSession";
        case EffectType::EnqueueSentence: return "EnqueueSentence";
        case EffectType::FlushSpeech: return "FlushSpeech";
        case EffectType::StopSpeech: return "StopSpeech";
        case EffectType::SetVadSpeakingMode: return "SetVadSpeakingMode";
        case EffectType::ResumeListening: return "ResumeListening";
        case EffectType::StartAudio: return "StartAudio";
        case EffectType::HaltAudio: return "HaltAudio";
        case EffectType::ConnectTransport: return "ConnectTransport";
        case EffectType::DisconnectTransport: return "DisconnectTransport";
        case EffectType::StartCalibration: return "StartCalibration";
        case EffectType::CancelCalibration: return "CancelCalibration";
        case EffectType::ReportError: return "ReportError";
    }
    return "Unknown";
}

DialogueStateMachine::DialogueStateMachine(const ConversationConfig& config, Clock clock)
    : config_(config)
    , clock_(clock ? std::move(clock) : Clock([] { return std::chrono::system_clock::now(); }))
    , mode_(config.input_mode) {
}

bool DialogueStateMachine::capturing() const {
    return isIn(ConversationStateKind::Listening) || isIn(ConversationStateKind::Interrupted);
}

std::vector<Effect> DialogueStateMachine::handle(const Event& event) {
    std::vector<Effect> fx;
    const bool handsFree = mode_ == InputMode::HandsFree;
    const bool inTurn = isIn(ConversationStateKind::Processing) || isIn(ConversationStateKind::Speaking);

    switch (event.type) {
        case EventType::StartConversation:
            onStart(fx);
            break;

        case EventType::StopConversation:
            onStop(fx);
            break;

        case EventType::Restart:
            if (isIn(ConversationStateKind::Error)) {
                resetTurn();
                utterance_.clear();
                state_ = ConversationState::idle();
                fx.push_back(effect(EffectType::StartAudio));
                fx.push_back(effect(EffectType::ConnectTransport));
                if (mode_ == InputMode::HandsFree) {
                    Effect resume{EffectType::ResumeListening};
                    resume.delay_ms = config_.resume_delay_ms;
                    fx.push_back(resume);
                }
            }
            break;

        case EventType::ClearHistory:
            // Turn ordering flags survive so an in-flight response keeps streaming
            messages_.clear();
            utterance_.clear();
            response_.clear();
            spoken_.clear();
            fx.push_back(effect(EffectType::SendClear));
            fx.push_back(effect(EffectType::NewSession));
            break;

        case EventType::SetInputMode:
            mode_ = event.mode;
            break;

        case EventType::PushToTalkPressed:
            if (!active_ || mode_ != InputMode::PushToTalk) break;
            if (isIn(ConversationStateKind::Idle)) {
                utterance_.clear();
                state_ = ConversationState::listening();
                vadTurn_ = false;
                fx.push_back(effect(EffectType::StartRecognition));
            } else if (isIn(ConversationStateKind::Speaking)) {
                bargeIn(fx);
                vadTurn_ = false;
            }
            break;

        case EventType::PushToTalkReleased:
            if (capturing() && mode_ == InputMode::PushToTalk) {
                fx.push_back(effect(EffectType::StopRecognition));
            }
            break;

        case EventType::ManualInterrupt:
            if (inTurn) {
                cutOffTurn(fx);
                fx.push_back(effect(EffectType::SendInterrupt));
                enterIdle(fx, true);
            }
            break;

        case EventType::StartCalibration:
            if (active_ && isIn(ConversationStateKind::Idle)) {
                fx.push_back(effect(EffectType::StartCalibration));
            }
            break;

        case EventType::CancelCalibration:
            fx.push_back(effect(EffectType::CancelCalibration));
            break;

        case EventType::SpeechStart:
            if (!active_) break;
            // Input mode only decides who opens a turn from idle
            if (isIn(ConversationStateKind::Idle) && handsFree) {
                utterance_.clear();
                state_ = ConversationState::listening();
                vadTurn_ = true;
                fx.push_back(effect(EffectType::StartRecognition));
            } else if (isIn(ConversationStateKind::Speaking)) {
                bargeIn(fx);
                vadTurn_ = true;
            }
            // A second speechStart while listening or interrupted is ignored
            break;

        case EventType::SpeechEnd:
            if (capturing() && (handsFree || vadTurn_)) {
                fx.push_back(effect(EffectType::StopRecognition));
            }
            break;

        case EventType::SpeechDiscarded:
            if (capturing() && (handsFree || vadTurn_)) {
                utterance_.clear();
                fx.push_back(effect(EffectType::CancelRecognition));
                enterIdle(fx, true);
            }
            break;

        case EventType::PartialTranscript:
            if (capturing()) {
                utterance_.partial_text = event.text;
            }
            break;

        case EventType::FinalTranscript:
            if (capturing()) {
                onFinalTranscript(event.text, fx);
            }
            break;

        case EventType::RecognitionFailed:
            if (active_ && !isIn(ConversationStateKind::Error)) {
                enterError("speech recognition failed: " + event.text, ErrorKind::Recognition, fx);
            } else {
                fx.push_back(Effect{EffectType::ReportError, event.text, false, 0, ErrorKind::Recognition});
            }
            break;

        case EventType::TransportConnected:
        case EventType::Cleared:
        case EventType::SpeakingStarted:
            break;

        case EventType::TextStart:
            if (isIn(ConversationStateKind::Processing)) {
                response_.clear();
                spoken_.clear();
                turnStarted_ = true;
                responseRecorded_ = false;
            }
            break;

        case EventType::TextDelta:
            if (!inTurn) break;
            if (!turnStarted_) {
                reportOrdering(event, fx);
                break;
            }
            response_ += event.text;
            break;

        case EventType::SentenceEnd:
            if (!inTurn) break;
            if (!turnStarted_) {
                reportOrdering(event, fx);
                break;
            }
            if (!trim(event.text).empty()) {
                if (!spoken_.empty()) spoken_ += ' ';
                spoken_ += event.text;
                fx.push_back(effect(EffectType::EnqueueSentence, event.text));
                if (isIn(ConversationStateKind::Processing)) {
                    enterSpeaking(fx);
                }
            }
            break;

        case EventType::TextDone:
            if (!inTurn) break;
            if (!turnStarted_) {
                reportOrdering(event, fx);
                break;
            }
            onTextDone(event.text, fx);
            break;

        case EventType::ServerInterrupted:
            if (inTurn) {
                cutOffTurn(fx);
                enterIdle(fx, true);
            }
            break;

        case EventType::ServerError:
        case EventType::SendFailed:
            if (isIn(ConversationStateKind::Processing)) {
                enterError(event.text, ErrorKind::Transport, fx);
            } else {
                fx.push_back(Effect{EffectType::ReportError, event.text, false, 0, ErrorKind::Transport});
            }
            break;

        case EventType::TransportFailed:
            if (active_ && !isIn(ConversationStateKind::Error)) {
                enterError(event.text, ErrorKind::Transport, fx);
            }
            break;

        case EventType::SpeakingFinished:
            if (isIn(ConversationStateKind::Speaking)) {
                resetTurn();
                enterIdle(fx, true);
            }
            break;

        case EventType::SynthesisFailed:
            if (inTurn) {
                enterError("speech synthesis failed: " + event.text, ErrorKind::Synthesis, fx);
            } else {
                fx.push_back(Effect{EffectType::ReportError, event.text, false, 0, ErrorKind::Synthesis});
            }
            break;
    }

    return fx;
}

void DialogueStateMachine::onStart(std::vector<Effect>& fx) {
    if (active_) return;
    active_ = true;
    state_ = ConversationState::idle();
    utterance_.clear();
    resetTurn();
    fx.push_back(effect(EffectType::StartAudio));
    fx.push_back(effect(EffectType::ConnectTransport));
}

void DialogueStateMachine::onStop(std::vector<Effect>& fx) {
    if (!active_) return;

    if (isIn(ConversationStateKind::Processing) || isIn(ConversationStateKind::Speaking)) {
        fx.push_back(effect(EffectType::SendInterrupt));
    }
    fx.push_back(effect(EffectType::StopSpeech));
    fx.push_back(effect(EffectType::CancelRecognition));
    fx.push_back(effect(EffectType::HaltAudio));
    fx.push_back(effect(EffectType::DisconnectTransport));

    active_ = false;
    utterance_.clear();
    resetTurn();
    state_ = ConversationState::idle();
}

void DialogueStateMachine::onFinalTranscript(const std::string& text, std::vector<Effect>& fx) {
    std::string transcript = trim(text);
    if (transcript.empty()) {
        transcript = trim(utterance_.partial_text);
    }

    if (transcript.empty()) {
        utterance_.clear();
        enterIdle(fx, true);
        return;
    }

    utterance_.final_text = transcript;
    utterance_.is_final = true;
    addMessage(Message::Role::User, transcript);
    utterance_.clear();

    resetTurn();
    state_ = ConversationState::processing();
    fx.push_back(effect(EffectType::SendText, transcript));
}

void DialogueStateMachine::onTextDone(const std::string& full_text, std::vector<Effect>& fx) {
    const std::string content = trim(full_text).empty() ? trim(response_) : trim(full_text);
    turnStarted_ = false;

    if (!content.empty()) {
        response_ = content;
        addMessage(Message::Role::Assistant, content);
        responseRecorded_ = true;
    }

    if (isIn(ConversationStateKind::Speaking)) {
        fx.push_back(effect(EffectType::FlushSpeech));
        return;
    }

    // Processing: nothing was spoken yet
    if (content.empty()) {
        resetTurn();
        enterIdle(fx, true);
        return;
    }

    spoken_ = content;
    fx.push_back(effect(EffectType::EnqueueSentence, content));
    fx.push_back(effect(EffectType::FlushSpeech));
    enterSpeaking(fx);
}

void DialogueStateMachine::bargeIn(std::vector<Effect>& fx) {
    // Playback stops before the recognizer opens
    cutOffTurn(fx);
    fx.push_back(effect(EffectType::SendInterrupt));
    utterance_.clear();
    state_ = ConversationState::interrupted();
    fx.push_back(effect(EffectType::StartRecognition));
}

void DialogueStateMachine::cutOffTurn(std::vector<Effect>& fx) {
    fx.push_back(effect(EffectType::StopSpeech));

    Effect speaking{EffectType::SetVadSpeakingMode};
    speaking.flag = false;
    fx.push_back(speaking);

    if (!responseRecorded_) {
        const std::string partial = trim(response_.empty() ? spoken_ : response_);
        if (partial.size() > config_.interrupt_min_chars) {
            addMessage(Message::Role::Assistant, partial + "... [interrupted]");
        }
    }
    resetTurn();
}

void DialogueStateMachine::enterIdle(std::vector<Effect>& fx, bool resume) {
    state_ = ConversationState::idle();
    if (resume && active_ && mode_ == InputMode::HandsFree) {
        Effect resume{EffectType::ResumeListening};
        resume.delay_ms = config_.resume_delay_ms;
        fx.push_back(resume);
    }
}

void DialogueStateMachine::enterSpeaking(std::vector<Effect>& fx) {
    state_ = ConversationState::speaking();
    Effect speaking{EffectType::SetVadSpeakingMode};
    speaking.flag = true;
    fx.push_back(speaking);
}

void DialogueStateMachine::enterError(const std::string& reason, ErrorKind kind, std::vector<Effect>& fx) {
    std::cerr << "[DialogueStateMachine] " << toString(kind) << ": " << reason << std::endl;
    state_ = ConversationState::error(reason);
    utterance_.clear();
    resetTurn();
    fx.push_back(effect(EffectType::HaltAudio));
    fx.push_back(Effect{EffectType::ReportError, reason, false, 0, kind});
}

void DialogueStateMachine::reportOrdering(const Event& event, std::vector<Effect>& fx) {
    const std::string message = std::string(toString(event.type)) + " received before text_start";
    std::cerr << "[DialogueStateMachine] " << message << ", ignored" << std::endl;
    fx.push_back(Effect{EffectType::ReportError, message, false, 0, ErrorKind::ProtocolOrdering});
}

void DialogueStateMachine::addMessage(Message::Role role, std::string content) {
    messages_.push_back(Message{role, std::move(content), clock_()});
}

void DialogueStateMachine::resetTurn() {
    response_.clear();
    spoken_.clear();
    turnStarted_ = false;
    responseRecorded_ = false;
}

} // namespace parley
