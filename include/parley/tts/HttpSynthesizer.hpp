/**
 * HttpSynthesizer.hpp - Synthesis over a local HTTP speech server
 *
 *   POST /synthesize {"text", "voice", "speed"} -> audio/wav
 *   GET  /health
 */

#pragma once

#include "parley/Config.hpp"
#include "parley/tts/Synthesizer.hpp"

#include <memory>

namespace parley::tts {

class HttpSynthesizer : public Synthesizer {
public:
    explicit HttpSynthesizer(const TtsConfig& config);
    ~HttpSynthesizer() override;

    HttpSynthesizer(const HttpSynthesizer&) = delete;
    HttpSynthesizer& operator=(const HttpSynthesizer&) = delete;

    SynthesisResult synthesize(const std::string& text) override;

    /**
     * True once the server answered /health. Re-checked lazily on synthesize().
     */
    bool isReady() const override;
    void cancel() override;

    bool checkServer();
    void setSpeed(float speed);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace parley::tts
