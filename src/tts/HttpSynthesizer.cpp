/**
 * HttpSynthesizer.cpp - Synthesis over a local HTTP speech server
 *
 * Connects to a persistent synthesis server that keeps the voice model loaded.
 * Responses are WAV bytes decoded to mono float.
 */

#include "parley/tts/HttpSynthesizer.hpp"
#include "parley/audio/Wav.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <atomic>
#include <iostream>
#include <mutex>

namespace parley::tts {

struct HttpSynthesizer::Impl {
    TtsConfig config;
    httplib::Client client;
    std::mutex request_mutex;  // One request at a time per client
    std::atomic<bool> server_available{false};
    std::atomic<bool> cancelled{false};

    explicit Impl(const TtsConfig& cfg)
        : config(cfg)
        , client(cfg.server_url) {
        const time_t sec = cfg.timeout_ms / 1000;
        const time_t usec = (cfg.timeout_ms % 1000) * 1000;
        client.set_connection_timeout(2, 0);
        client.set_read_timeout(sec, usec);
        client.set_write_timeout(sec, usec);
    }

    bool checkServer() {
        std::lock_guard<std::mutex> lock(request_mutex);
        auto res = client.Get("/health");
        const bool ok = res && res->status == 200;
        if (ok && !server_available) {
            std::cout << "[HttpSynthesizer] Connected to speech server at " << config.server_url << std::endl;
        } else if (!ok) {
            std::cerr << "[HttpSynthesizer] Speech server not reachable at " << config.server_url << std::endl;
        }
        server_available = ok;
        return ok;
    }

    SynthesisResult synthesize(const std::string& text) {
        SynthesisResult result;
        if (text.empty()) {
            return result;
        }

        if (!server_available && !checkServer()) {
            result.error = "speech server not available at " + config.server_url;
            return result;
        }

        std::lock_guard<std::mutex> lock(request_mutex);
        nlohmann::json body = {
            {"text", text},
            {"voice", config.voice},
            {"speed", config.speed}
        };

        cancelled = false;
        auto res = client.Post("/synthesize", body.dump(), "application/json");

        if (cancelled) {
            result.error = "cancelled";
            return result;
        }
        if (!res) {
            server_available = false;
            result.error = "synthesis request failed: " + httplib::to_string(res.error());
            std::cerr << "[HttpSynthesizer] " << result.error << std::endl;
            return result;
        }
        if (res->status == 404) {
            result.error = "voice unavailable: " + config.voice;
            std::cerr << "[HttpSynthesizer] " << result.error << std::endl;
            return result;
        }
        if (res->status != 200) {
            result.error = "speech server returned HTTP " + std::to_string(res->status);
            std::cerr << "[HttpSynthesizer] " << result.error << std::endl;
            return result;
        }

        std::vector<uint8_t> bytes(res->body.begin(), res->body.end());
        audio::WavData wav;
        std::string error;
        if (!audio::decodeWav(bytes, wav, error)) {
            result.error = "invalid audio from speech server: " + error;
            std::cerr << "[HttpSynthesizer] " << result.error << std::endl;
            return result;
        }

        result.samples = std::move(wav.samples);
        result.sample_rate = wav.sample_rate;
        return result;
    }
};

HttpSynthesizer::HttpSynthesizer(const TtsConfig& config)
    : impl_(std::make_unique<Impl>(config)) {
    std::cout << "[HttpSynthesizer] Server: " << config.server_url
              << ", voice: " << config.voice << ", speed: " << config.speed << std::endl;
}

HttpSynthesizer::~HttpSynthesizer() = default;

SynthesisResult HttpSynthesizer::synthesize(const std::string& text) {
    return impl_->synthesize(text);
}

bool HttpSynthesizer::isReady() const {
    return impl_->server_available;
}

void HttpSynthesizer::cancel() {
    impl_->cancelled = true;
    impl_->client.stop();
}

bool HttpSynthesizer::checkServer() {
    return impl_->checkServer();
}

void HttpSynthesizer::setSpeed(float speed) {
    std::lock_guard<std::mutex> lock(impl_->request_mutex);
    impl_->config.speed = speed;
}

} // namespace parley::tts
