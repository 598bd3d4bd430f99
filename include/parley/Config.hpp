/**
 * Config.hpp - Runtime configuration
 *
 * All options are optional in the JSON file; missing keys keep the defaults below.
 */

#pragma once

#include "parley/Types.hpp"

#include <string>

namespace parley {

struct AudioConfig {
    int sample_rate = 16000;
    int channels = 1;
    int frames_per_buffer = 512;
    int input_device = -1;   // -1 = system default
    int output_device = -1;
};

struct VadConfig {
    float threshold = 0.02f;            // RMS threshold used until calibrated
    bool auto_calibrate = false;        // "threshold": "calibrated"
    int frame_ms = 30;
    int speech_start_ms = 60;           // Sustained energy needed for speechStart
    int silence_timeout_ms = 800;
    int min_speech_ms = 200;
    int max_speech_ms = 30000;
    int calibration_ms = 2000;
    int auto_calibration_ms = 500;
    int webrtc_mode = 2;                // libfvad aggressiveness 0-3, -1 disables it
    float interrupt_threshold_scale = 1.2f;
};

struct SttConfig {
    std::string model_path = "models/whisper/ggml-base.en-q5_1.bin";
    std::string language = "en";
    int threads = 4;
    int partial_interval_ms = 1000;
};

struct TtsConfig {
    std::string server_url = "http://localhost:5050";
    std::string voice = "default";
    float speed = 1.0f;
    int max_chunk_chars = 100;
    int timeout_ms = 15000;
    int max_queued_ms = 10000;  // Synthesized audio allowed ahead of playback
};

struct TransportConfig {
    int heartbeat_interval_ms = 30000;
    int max_reconnect_attempts = 5;
    int reconnect_base_delay_ms = 500;
    int connect_timeout_ms = 5000;
};

struct ConversationConfig {
    InputMode input_mode = InputMode::HandsFree;
    std::size_t interrupt_min_chars = 20;
    int resume_delay_ms = 200;
};

struct Config {
    std::string server_url = "ws://127.0.0.1:8000/api/ws/conversation";
    AudioConfig audio;
    VadConfig vad;
    SttConfig stt;
    TtsConfig tts;
    TransportConfig transport;
    ConversationConfig conversation;
};

/**
 * Load configuration from a JSON file on top of the defaults.
 * Returns false and fills `error` if the file is unreadable or malformed.
 */
bool loadConfig(const std::string& path, Config& config, std::string& error);

/**
 * Parse configuration from a JSON document string.
 */
bool parseConfig(const std::string& json_text, Config& config, std::string& error);

} // namespace parley
