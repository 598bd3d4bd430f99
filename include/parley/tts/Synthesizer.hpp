/**
 * Synthesizer.hpp - Text-to-speech capability
 */

#pragma once

#include <string>
#include <vector>

namespace parley::tts {

struct SynthesisResult {
    std::vector<float> samples;  // Mono, [-1, 1]
    int sample_rate = 0;
    std::string error;           // Empty on success

    bool ok() const { return error.empty(); }
};

class Synthesizer {
public:
    virtual ~Synthesizer() = default;

    /**
     * Blocking. May be interrupted by cancel() from another thread,
     * in which case the result carries an error and is discarded by the caller.
     */
    virtual SynthesisResult synthesize(const std::string& text) = 0;

    virtual bool isReady() const = 0;
    virtual void cancel() = 0;
};

} // namespace parley::tts
