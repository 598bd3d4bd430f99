/**
 * Types.hpp - Shared conversation types
 *
 * State, input mode, messages and the error taxonomy used across components.
 */

#pragma once

#include <chrono>
#include <string>

namespace parley {

enum class ConversationStateKind {
    Idle,
    Listening,
    Processing,
    Speaking,
    Interrupted,  // Listening after the previous turn was cut off
    Error
};

/**
 * Authoritative conversation state. `reason` is only meaningful for Error.
 */
struct ConversationState {
    ConversationStateKind kind = ConversationStateKind::Idle;
    std::string reason;

    static ConversationState idle() { return {ConversationStateKind::Idle, {}}; }
    static ConversationState listening() { return {ConversationStateKind::Listening, {}}; }
    static ConversationState processing() { return {ConversationStateKind::Processing, {}}; }
    static ConversationState speaking() { return {ConversationStateKind::Speaking, {}}; }
    static ConversationState interrupted() { return {ConversationStateKind::Interrupted, {}}; }
    static ConversationState error(std::string why) {
        return {ConversationStateKind::Error, std::move(why)};
    }

    bool is(ConversationStateKind k) const { return kind == k; }

    bool operator==(const ConversationState& other) const {
        return kind == other.kind && reason == other.reason;
    }
    bool operator!=(const ConversationState& other) const { return !(*this == other); }
};

const char* toString(ConversationStateKind kind);
std::string describe(const ConversationState& state);

enum class InputMode {
    HandsFree,
    PushToTalk
};

const char* toString(InputMode mode);

struct Message {
    enum class Role { User, Assistant };

    Role role;
    std::string content;
    std::chrono::system_clock::time_point timestamp;
};

/**
 * Recognized text for the current user turn.
 */
struct Utterance {
    std::string partial_text;
    std::string final_text;
    bool is_final = false;

    void clear() {
        partial_text.clear();
        final_text.clear();
        is_final = false;
    }
};

enum class ErrorKind {
    Transport,         // Connection lost, send failed, protocol violation
    Recognition,       // Permission denied, engine failure
    Synthesis,         // Voice unavailable, engine failure
    ProtocolOrdering,  // Event received in an invalid state
    Configuration
};

const char* toString(ErrorKind kind);

struct Error {
    ErrorKind kind;
    std::string message;
};

} // namespace parley
