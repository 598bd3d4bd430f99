/**
 * VADProcessor.hpp - Energy endpointer with optional WebRTC (libfvad) confirmation
 *
 * Emits speech start/end boundaries from a running stream of capture buffers.
 * All timing is derived from the number of samples consumed.
 */

#pragma once

#include "parley/Config.hpp"

#include <cstddef>
#include <functional>
#include <memory>

namespace parley::audio {

enum class VadEventType {
    SpeechStart,
    SpeechEnd,
    SpeechDiscarded  // Silence timeout reached before the minimum speech duration
};

struct VadEvent {
    VadEventType type;
    int duration_ms = 0;  // Voiced span, for SpeechEnd / SpeechDiscarded
};

using VadCallback = std::function<void(const VadEvent& event)>;
using CalibrationCallback = std::function<void(float progress, bool finished)>;

class VADProcessor {
public:
    explicit VADProcessor(const VadConfig& config = VadConfig{}, int sample_rate = 16000);
    ~VADProcessor();

    VADProcessor(const VADProcessor&) = delete;
    VADProcessor& operator=(const VADProcessor&) = delete;

    /**
     * Feed capture audio. Callbacks fire on the calling thread.
     */
    void process(const float* samples, size_t count);

    void setEventCallback(VadCallback callback);
    void setCalibrationCallback(CalibrationCallback callback);

    void setSilenceTimeout(int timeout_ms);
    void setMinSpeechDuration(int min_ms);

    /**
     * While the assistant is speaking, the threshold is raised by
     * VadConfig::interrupt_threshold_scale.
     */
    void setSpeakingMode(bool speaking);

    /**
     * Sample ambient noise for `duration_ms` and derive the threshold.
     * Restarting discards any calibration in progress.
     */
    void startCalibration(int duration_ms);
    void cancelCalibration();

    bool isCalibrating() const;
    bool isCalibrated() const;
    float calibrationProgress() const;

    float threshold() const;
    float activeThreshold() const;
    float noiseFloor() const;

    bool isSpeaking() const;
    int currentSpeechDuration() const;
    bool hasWebRtcClassifier() const;

    /**
     * Drop any partial speech segment. Calibration results are kept.
     */
    void reset();

private:
    struct Impl;
    std::unique_ptr<Impl> pImpl_;
};

} // namespace parley::audio
