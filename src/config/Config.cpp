/**
 * Config.cpp - JSON configuration loader
 *
 * Keys mirror the structs in Config.hpp. Unknown keys are ignored.
 */

#include "parley/Config.hpp"

#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace parley {

namespace {

template <typename T>
void read(const json& section, const char* key, T& field) {
    auto it = section.find(key);
    if (it != section.end() && !it->is_null()) {
        field = it->get<T>();
    }
}

const json& sectionOf(const json& root, const char* name) {
    static const json empty = json::object();
    auto it = root.find(name);
    if (it == root.end()) return empty;
    if (!it->is_object()) {
        throw std::invalid_argument(std::string("section '") + name + "' must be an object");
    }
    return *it;
}

InputMode parseInputMode(const std::string& value) {
    if (value == "hands_free" || value == "handsFree") return InputMode::HandsFree;
    if (value == "push_to_talk" || value == "pushToTalk") return InputMode::PushToTalk;
    throw std::invalid_argument("unknown input_mode: " + value);
}

void apply(const json& root, Config& config) {
    if (!root.is_object()) {
        throw std::invalid_argument("configuration root must be an object");
    }

    read(root, "server_url", config.server_url);

    if (root.contains("input_mode")) {
        config.conversation.input_mode = parseInputMode(root.at("input_mode").get<std::string>());
    }

    const json& audio = sectionOf(root, "audio");
    read(audio, "sample_rate", config.audio.sample_rate);
    read(audio, "frames_per_buffer", config.audio.frames_per_buffer);
    read(audio, "input_device", config.audio.input_device);
    read(audio, "output_device", config.audio.output_device);

    const json& vad = sectionOf(root, "vad");
    if (vad.contains("threshold")) {
        const json& t = vad.at("threshold");
        if (t.is_string()) {
            if (t.get<std::string>() != "calibrated") {
                throw std::invalid_argument("vad.threshold must be a number or \"calibrated\"");
            }
            config.vad.auto_calibrate = true;
        } else {
            config.vad.threshold = t.get<float>();
            config.vad.auto_calibrate = false;
        }
    }
    read(vad, "frame_ms", config.vad.frame_ms);
    read(vad, "speech_start_ms", config.vad.speech_start_ms);
    read(vad, "silence_timeout_ms", config.vad.silence_timeout_ms);
    read(vad, "min_speech_ms", config.vad.min_speech_ms);
    read(vad, "max_speech_ms", config.vad.max_speech_ms);
    read(vad, "calibration_ms", config.vad.calibration_ms);
    read(vad, "auto_calibration_ms", config.vad.auto_calibration_ms);
    read(vad, "webrtc_mode", config.vad.webrtc_mode);
    read(vad, "interrupt_threshold_scale", config.vad.interrupt_threshold_scale);

    const json& stt = sectionOf(root, "stt");
    read(stt, "model_path", config.stt.model_path);
    read(stt, "language", config.stt.language);
    read(stt, "threads", config.stt.threads);
    read(stt, "partial_interval_ms", config.stt.partial_interval_ms);

    const json& tts = sectionOf(root, "tts");
    read(tts, "server_url", config.tts.server_url);
    read(tts, "voice", config.tts.voice);
    read(tts, "speed", config.tts.speed);
    read(tts, "max_chunk_chars", config.tts.max_chunk_chars);
    read(tts, "timeout_ms", config.tts.timeout_ms);
    read(tts, "max_queued_ms", config.tts.max_queued_ms);

    const json& transport = sectionOf(root, "transport");
    read(transport, "heartbeat_interval_ms", config.transport.heartbeat_interval_ms);
    read(transport, "max_reconnect_attempts", config.transport.max_reconnect_attempts);
    read(transport, "reconnect_base_delay_ms", config.transport.reconnect_base_delay_ms);
    read(transport, "connect_timeout_ms", config.transport.connect_timeout_ms);

    const json& conversation = sectionOf(root, "conversation");
    if (conversation.contains("interrupt_min_chars")) {
        // Read signed so a negative value is rejected instead of wrapping
        const auto min_chars = conversation.at("interrupt_min_chars").get<long long>();
        if (min_chars < 0) {
            throw std::invalid_argument("conversation.interrupt_min_chars must be >= 0");
        }
        config.conversation.interrupt_min_chars = static_cast<std::size_t>(min_chars);
    }
    read(conversation, "resume_delay_ms", config.conversation.resume_delay_ms);
    if (conversation.contains("input_mode")) {
        config.conversation.input_mode = parseInputMode(conversation.at("input_mode").get<std::string>());
    }

    if (config.vad.frame_ms != 10 && config.vad.frame_ms != 20 && config.vad.frame_ms != 30) {
        throw std::invalid_argument("vad.frame_ms must be 10, 20 or 30");
    }
    if (config.transport.max_reconnect_attempts < 0) {
        throw std::invalid_argument("transport.max_reconnect_attempts must be >= 0");
    }
    if (config.transport.heartbeat_interval_ms <= 0) {
        throw std::invalid_argument("transport.heartbeat_interval_ms must be positive");
    }
}

} // anonymous namespace

bool parseConfig(const std::string& json_text, Config& config, std::string& error) {
    Config parsed = config;
    try {
        parley::apply(json::parse(json_text), parsed);
    } catch (const std::exception& e) {
        error = e.what();
        return false;
    }
    config = std::move(parsed);
    return true;
}

bool loadConfig(const std::string& path, Config& config, std::string& error) {
    std::ifstream file(path);
    if (!file.good()) {
        error = "cannot open " + path;
        return false;
    }

    std::stringstream contents;
    contents << file.rdbuf();

    if (!parseConfig(contents.str(), config, error)) {
        std::cerr << "[Config] " << path << ": " << error << std::endl;
        return false;
    }

    std::cout << "[Config] Loaded " << path << std::endl;
    return true;
}

} // namespace parley
