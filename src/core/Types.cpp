/**
 * Types.cpp - String conversions for shared conversation types
 */

#include "parley/Types.hpp"

namespace parley {

const char* toString(ConversationStateKind kind) {
    switch (kind) {
        case ConversationStateKind::Idle: return "idle";
        case ConversationStateKind::Listening: return "listening";
        case ConversationStateKind::Processing: return "processing";
        case ConversationStateKind::Speaking: return "speaking";
        case ConversationStateKind::Interrupted: return "interrupted";
        case ConversationStateKind::Error: return "error";
    }
    return "unknown";
}

std::string describe(const ConversationState& state) {
    if (state.kind == ConversationStateKind::Error) {
        return std::string("error(") + state.reason + ")";
    }
    return toString(state.kind);
}

const char* toString(InputMode mode) {
    switch (mode) {
        case InputMode::HandsFree: return "hands_free";
        case InputMode::PushToTalk: return "push_to_talk";
    }
    return "unknown";
}

const char* toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Transport: return "TransportError";
        case ErrorKind::Recognition: return "RecognitionError";
        case ErrorKind::Synthesis: return "SynthesisError";
        case ErrorKind::ProtocolOrdering: return "ProtocolOrderingError";
        case ErrorKind::Configuration: return "ConfigurationError";
    }
    return "Error";
}

} // namespace parley
