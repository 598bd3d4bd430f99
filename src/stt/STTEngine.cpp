/**
 * STTEngine.cpp - Offline transcription with whisper.cpp
 *
 * The model is loaded once and stays resident. transcribe() is not reentrant;
 * WhisperRecognizer serializes calls on its worker thread.
 */

#include "parley/stt/STTEngine.hpp"

#include <chrono>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include "whisper.h"

namespace parley::stt {

namespace {

// Shorter clips make whisper hallucinate, pad them with silence
constexpr size_t MIN_SAMPLES = 16000 + 1600;

} // anonymous namespace

struct STTEngine::Impl {
    SttConfig config;
    whisper_context* ctx = nullptr;
    whisper_full_params params{};
    std::string lastError;
    int lastInferenceMs = 0;

    explicit Impl(const SttConfig& cfg) : config(cfg) {
        if (!std::ifstream(config.model_path).good()) {
            lastError = "model file not found: " + config.model_path;
            std::cerr << "[STTEngine] " << lastError << std::endl;
            return;
        }

        whisper_context_params cparams = whisper_context_default_params();
        ctx = whisper_init_from_file_with_params(config.model_path.c_str(), cparams);
        if (!ctx) {
            lastError = "failed to load model: " + config.model_path;
            std::cerr << "[STTEngine] " << lastError << std::endl;
            return;
        }

        params = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
        params.language = config.language.c_str();
        params.n_threads = config.threads;
        params.translate = false;
        params.print_progress = false;
        params.print_timestamps = false;
        params.print_realtime = false;
        params.print_special = false;
        // One short utterance per call, no carry-over between turns
        params.single_segment = true;
        params.no_context = true;
        params.suppress_blank = true;

        std::cout << "[STTEngine] Model loaded: " << config.model_path
                  << " (language=" << config.language << ", threads=" << config.threads << ")" << std::endl;
    }

    ~Impl() {
        if (ctx) {
            whisper_free(ctx);
        }
    }
};

STTEngine::STTEngine(const SttConfig& config)
    : impl_(std::make_unique<Impl>(config)) {
}

STTEngine::~STTEngine() = default;

STTEngine::STTEngine(STTEngine&& other) noexcept = default;

bool STTEngine::transcribe(const std::vector<float>& audio, std::string& text) {
    text.clear();
    if (!isReady()) {
        return false;
    }
    if (audio.empty()) {
        return true;
    }

    const float* samples = audio.data();
    std::vector<float> padded;
    if (audio.size() < MIN_SAMPLES) {
        padded = audio;
        padded.resize(MIN_SAMPLES, 0.0f);
        samples = padded.data();
    }
    const int count = static_cast<int>(padded.empty() ? audio.size() : padded.size());

    const auto start = std::chrono::steady_clock::now();
    const int result = whisper_full(impl_->ctx, impl_->params, samples, count);
    if (result != 0) {
        impl_->lastError = "whisper_full failed with code " + std::to_string(result);
        std::cerr << "[STTEngine] " << impl_->lastError << std::endl;
        return false;
    }

    std::string raw;
    const int segments = whisper_full_n_segments(impl_->ctx);
    for (int i = 0; i < segments; ++i) {
        if (const char* segment = whisper_full_get_segment_text(impl_->ctx, i)) {
            raw += segment;
        }
    }

    impl_->lastInferenceMs = static_cast<int>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count());
    text = cleanTranscript(raw);
    return true;
}

bool STTEngine::isReady() const {
    return impl_ && impl_->ctx != nullptr;
}

std::string STTEngine::getModelInfo() const {
    if (!isReady()) {
        return "Model not loaded";
    }
    return "whisper (" + impl_->config.model_path + ", " + impl_->config.language + ")";
}

std::string STTEngine::lastError() const {
    return impl_ ? impl_->lastError : std::string("engine moved from");
}

int STTEngine::lastInferenceMs() const {
    return impl_ ? impl_->lastInferenceMs : 0;
}

std::string STTEngine::cleanTranscript(const std::string& raw) {
    std::string out;
    out.reserve(raw.size());

    int depth = 0;
    for (char c : raw) {
        if (c == '[' || c == '(') {
            ++depth;
        } else if ((c == ']' || c == ')') && depth > 0) {
            --depth;
        } else if (depth == 0) {
            out += c;
        }
    }

    std::string collapsed;
    bool space = false;
    for (char c : out) {
        if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
            space = !collapsed.empty();
        } else {
            if (space) collapsed += ' ';
            collapsed += c;
            space = false;
        }
    }
    return collapsed;
}

} // namespace parley::stt
