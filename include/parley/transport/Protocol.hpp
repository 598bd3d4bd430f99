/**
 * Protocol.hpp - Conversation wire format
 *
 * Every frame is one JSON object with a "type" field.
 *
 * Client -> server: text, interrupt, clear, ping
 * Server -> client: text_start, text_delta, sentence_end, text_done,
 *                   interrupted, error, pong, cleared
 */

#pragma once

#include <string>

namespace parley::transport {

enum class ServerMessageType {
    TextStart,
    TextDelta,
    SentenceEnd,
    TextDone,
    Interrupted,
    Error,
    Pong,
    Cleared,
    Unknown
};

const char* toString(ServerMessageType type);

struct ServerMessage {
    ServerMessageType type = ServerMessageType::Unknown;
    std::string text;        // text_delta content, sentence_end sentence, text_done full_text, error message
    std::string session_id;  // cleared
    std::string raw_type;    // Original "type" value
};

namespace protocol {

std::string encodeText(const std::string& content, const std::string& session_id);
std::string encodeInterrupt();
std::string encodeClear(const std::string& session_id);
std::string encodePing();

/**
 * Parse one server frame. Unknown types succeed with ServerMessageType::Unknown.
 * Returns false for frames that are not a JSON object with a string "type".
 */
bool decode(const std::string& payload, ServerMessage& out, std::string& error);

} // namespace protocol

} // namespace parley::transport
