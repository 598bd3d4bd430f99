/**
 * Protocol.cpp - Conversation wire format (nlohmann::json)
 */

#include "parley/transport/Protocol.hpp"

#include <nlohmann/json.hpp>

namespace parley::transport {

using json = nlohmann::json;

namespace {

std::string stringField(const json& j, const char* key) {
    auto it = j.find(key);
    if (it != j.end() && it->is_string()) {
        return it->get<std::string>();
    }
    return {};
}

ServerMessageType typeFromString(const std::string& type) {
    if (type == "text_start") return ServerMessageType::TextStart;
    if (type == "text_delta") return ServerMessageType::TextDelta;
    if (type == "sentence_end") return ServerMessageType::SentenceEnd;
    if (type == "text_done") return ServerMessageType::TextDone;
    if (type == "interrupted") return ServerMessageType::Interrupted;
    if (type == "error") return ServerMessageType::Error;
    if (type == "pong") return ServerMessageType::Pong;
    if (type == "cleared") return ServerMessageType::Cleared;
    return ServerMessageType::Unknown;
}

} // anonymous namespace

const char* toString(ServerMessageType type) {
    switch (type) {
        case ServerMessageType::TextStart: return "text_start";
        case ServerMessageType::TextDelta: return "text_delta";
        case ServerMessageType::SentenceEnd: return "sentence_end";
        case ServerMessageType::TextDone: return "text_done";
        case ServerMessageType::Interrupted: return "interrupted";
        case ServerMessageType::Error: return "error";
        case ServerMessageType::Pong: return "pong";
        case ServerMessageType::Cleared: return "cleared";
        case ServerMessageType::Unknown: break;
    }
    return "unknown";
}

namespace protocol {

std::string encodeText(const std::string& content, const std::string& session_id) {
    return json{{"type", "text"}, {"content", content}, {"session_id", session_id}}.dump();
}

std::string encodeInterrupt() {
    return json{{"type", "interrupt"}}.dump();
}

std::string encodeClear(const std::string& session_id) {
    return json{{"type", "clear"}, {"session_id", session_id}}.dump();
}

std::string encodePing() {
    return json{{"type", "ping"}}.dump();
}

bool decode(const std::string& payload, ServerMessage& out, std::string& error) {
    json j = json::parse(payload, nullptr, false);
    if (j.is_discarded()) {
        error = "malformed JSON frame";
        return false;
    }
    if (!j.is_object()) {
        error = "frame is not a JSON object";
        return false;
    }

    auto type = j.find("type");
    if (type == j.end() || !type->is_string()) {
        error = "frame has no type";
        return false;
    }

    out = ServerMessage{};
    out.raw_type = type->get<std::string>();
    out.type = typeFromString(out.raw_type);

    switch (out.type) {
        case ServerMessageType::TextDelta:
            out.text = stringField(j, "content");
            break;
        case ServerMessageType::SentenceEnd:
            out.text = stringField(j, "sentence");
            break;
        case ServerMessageType::TextDone:
            out.text = stringField(j, "full_text");
            break;
        case ServerMessageType::Error:
            out.text = stringField(j, "message");
            if (out.text.empty()) {
                out.text = stringField(j, "error");
            }
            if (out.text.empty()) {
                out.text = "unspecified server error";
            }
            break;
        case ServerMessageType::Cleared:
            out.session_id = stringField(j, "session_id");
            break;
        default:
            break;
    }

    return true;
}

} // namespace protocol

} // namespace parley::transport
