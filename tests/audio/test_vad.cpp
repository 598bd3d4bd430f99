/**
 * test_vad.cpp - Endpointer and calibration tests
 *
 * Runs in energy-only mode (webrtc_mode = -1) with synthetic constant-level
 * frames so every decision is deterministic.
 */

#include "parley/audio/VADProcessor.hpp"

#include <algorithm>
#include <cassert>
#include <cmath>
#include <iostream>
#include <vector>

using namespace parley::audio;

namespace {

constexpr int RATE = 16000;
constexpr float LOUD = 0.3f;

parley::VadConfig energyConfig() {
    parley::VadConfig config;
    config.threshold = 0.02f;
    config.frame_ms = 30;
    config.speech_start_ms = 60;
    config.silence_timeout_ms = 800;
    config.min_speech_ms = 200;
    config.max_speech_ms = 30000;
    config.webrtc_mode = -1;
    return config;
}

// Feeds `ms` of constant-level audio in uneven chunks
void feed(VADProcessor& vad, float level, int ms) {
    std::vector<float> samples(static_cast<size_t>(RATE) * ms / 1000, level);
    size_t offset = 0;
    while (offset < samples.size()) {
        const size_t n = std::min<size_t>(317, samples.size() - offset);
        vad.process(samples.data() + offset, n);
        offset += n;
    }
}

struct Recorder {
    std::vector<VadEvent> events;

    void attach(VADProcessor& vad) {
        vad.setEventCallback([this](const VadEvent& e) { events.push_back(e); });
    }

    size_t count(VadEventType type) const {
        size_t n = 0;
        for (const auto& e : events) {
            if (e.type == type) ++n;
        }
        return n;
    }
};

} // anonymous namespace

void test_speech_segment() {
    VADProcessor vad(energyConfig(), RATE);
    Recorder rec;
    rec.attach(vad);

    assert(!vad.hasWebRtcClassifier());

    feed(vad, 0.0f, 300);
    assert(rec.events.empty());

    feed(vad, LOUD, 600);
    assert(rec.events.size() == 1);
    assert(rec.events[0].type == VadEventType::SpeechStart);
    assert(vad.isSpeaking());
    assert(vad.currentSpeechDuration() == 600);

    feed(vad, 0.0f, 900);
    assert(rec.events.size() == 2);
    assert(rec.events[1].type == VadEventType::SpeechEnd);
    assert(rec.events[1].duration_ms == 600);
    assert(!vad.isSpeaking());

    std::cout << "[PASS] test_speech_segment" << std::endl;
}

void test_short_pause_keeps_segment() {
    VADProcessor vad(energyConfig(), RATE);
    Recorder rec;
    rec.attach(vad);

    feed(vad, LOUD, 300);
    feed(vad, 0.0f, 450);  // Below the silence timeout
    feed(vad, LOUD, 300);
    assert(rec.count(VadEventType::SpeechStart) == 1);
    assert(rec.count(VadEventType::SpeechEnd) == 0);

    feed(vad, 0.0f, 900);
    assert(rec.count(VadEventType::SpeechEnd) == 1);
    assert(rec.events.back().duration_ms == 1050);

    std::cout << "[PASS] test_short_pause_keeps_segment" << std::endl;
}

void test_blip_ignored() {
    VADProcessor vad(energyConfig(), RATE);
    Recorder rec;
    rec.attach(vad);

    // One voiced frame is shorter than speech_start_ms
    feed(vad, LOUD, 30);
    feed(vad, 0.0f, 1000);
    assert(rec.events.empty());

    std::cout << "[PASS] test_blip_ignored" << std::endl;
}

void test_short_speech_discarded() {
    VADProcessor vad(energyConfig(), RATE);
    Recorder rec;
    rec.attach(vad);

    feed(vad, LOUD, 120);
    feed(vad, 0.0f, 900);
    assert(rec.events.size() == 2);
    assert(rec.events[0].type == VadEventType::SpeechStart);
    assert(rec.events[1].type == VadEventType::SpeechDiscarded);
    assert(rec.events[1].duration_ms == 120);

    std::cout << "[PASS] test_short_speech_discarded" << std::endl;
}

void test_max_speech_forces_end() {
    auto config = energyConfig();
    config.max_speech_ms = 1200;
    VADProcessor vad(config, RATE);
    Recorder rec;
    rec.attach(vad);

    feed(vad, LOUD, 1260);
    assert(rec.count(VadEventType::SpeechEnd) == 1);
    assert(rec.events[1].duration_ms == 1200);

    std::cout << "[PASS] test_max_speech_forces_end" << std::endl;
}

void test_silence_timeout_setter() {
    VADProcessor vad(energyConfig(), RATE);
    Recorder rec;
    rec.attach(vad);
    vad.setSilenceTimeout(300);
    vad.setMinSpeechDuration(100);

    feed(vad, LOUD, 150);
    feed(vad, 0.0f, 330);
    assert(rec.count(VadEventType::SpeechEnd) == 1);

    std::cout << "[PASS] test_silence_timeout_setter" << std::endl;
}

void test_speaking_mode_raises_threshold() {
    VADProcessor vad(energyConfig(), RATE);
    Recorder rec;
    rec.attach(vad);

    // 0.022 clears 0.02 but not 0.02 * 1.2
    vad.setSpeakingMode(true);
    assert(std::fabs(vad.activeThreshold() - 0.024f) < 1e-5f);
    feed(vad, 0.022f, 600);
    assert(rec.events.empty());

    feed(vad, LOUD, 120);
    assert(rec.count(VadEventType::SpeechStart) == 1);

    vad.reset();
    rec.events.clear();
    vad.setSpeakingMode(false);
    assert(std::fabs(vad.activeThreshold() - 0.02f) < 1e-6f);
    feed(vad, 0.022f, 120);
    assert(rec.count(VadEventType::SpeechStart) == 1);

    std::cout << "[PASS] test_speaking_mode_raises_threshold" << std::endl;
}

void test_reset_drops_segment() {
    VADProcessor vad(energyConfig(), RATE);
    Recorder rec;
    rec.attach(vad);

    feed(vad, LOUD, 600);
    assert(vad.isSpeaking());
    vad.reset();
    assert(!vad.isSpeaking());

    feed(vad, 0.0f, 1000);
    assert(rec.count(VadEventType::SpeechEnd) == 0);
    assert(rec.count(VadEventType::SpeechDiscarded) == 0);

    std::cout << "[PASS] test_reset_drops_segment" << std::endl;
}

void test_calibration() {
    VADProcessor vad(energyConfig(), RATE);
    Recorder rec;
    rec.attach(vad);

    float lastProgress = 0.0f;
    bool finished = false;
    vad.setCalibrationCallback([&](float progress, bool done) {
        assert(progress >= lastProgress);
        lastProgress = progress;
        finished = finished || done;
    });

    vad.startCalibration(300);
    assert(vad.isCalibrating());
    assert(!vad.isCalibrated());

    // Loud ambient noise never produces speech events while calibrating
    feed(vad, 0.05f, 150);
    assert(vad.isCalibrating());
    assert(vad.calibrationProgress() > 0.0f && vad.calibrationProgress() < 1.0f);
    feed(vad, 0.05f, 150);

    assert(finished);
    assert(!vad.isCalibrating());
    assert(vad.isCalibrated());
    assert(std::fabs(vad.calibrationProgress() - 1.0f) < 1e-6f);
    assert(std::fabs(vad.noiseFloor() - 0.05f) < 1e-4f);
    assert(std::fabs(vad.threshold() - 0.09f) < 1e-4f);
    assert(rec.events.empty());

    std::cout << "[PASS] test_calibration (threshold=" << vad.threshold() << ")" << std::endl;
}

void test_calibration_clamps() {
    VADProcessor vad(energyConfig(), RATE);

    vad.startCalibration(300);
    feed(vad, 0.2f, 300);
    assert(std::fabs(vad.threshold() - 0.15f) < 1e-6f);

    vad.startCalibration(300);
    feed(vad, 0.0f, 300);
    assert(std::fabs(vad.threshold() - 0.008f) < 1e-6f);

    std::cout << "[PASS] test_calibration_clamps" << std::endl;
}

void test_calibration_cancel_keeps_threshold() {
    VADProcessor vad(energyConfig(), RATE);

    vad.startCalibration(600);
    feed(vad, 0.1f, 300);
    vad.cancelCalibration();

    assert(!vad.isCalibrating());
    assert(!vad.isCalibrated());
    assert(std::fabs(vad.threshold() - 0.02f) < 1e-6f);
    assert(vad.calibrationProgress() == 0.0f);

    std::cout << "[PASS] test_calibration_cancel_keeps_threshold" << std::endl;
}

void test_webrtc_classifier() {
    auto config = energyConfig();
    config.webrtc_mode = 2;
    VADProcessor vad(config, RATE);

    if (!vad.hasWebRtcClassifier()) {
        std::cout << "[SKIP] test_webrtc_classifier (libfvad rejected the settings)" << std::endl;
        return;
    }

    Recorder rec;
    rec.attach(vad);

    feed(vad, 0.0f, 300);
    feed(vad, LOUD, 600);
    feed(vad, 0.0f, 900);
    assert(vad.hasWebRtcClassifier());
    assert(!vad.isSpeaking());

    std::cout << "[PASS] test_webrtc_classifier (speech_start=" << rec.count(VadEventType::SpeechStart)
              << ", speech_end=" << rec.count(VadEventType::SpeechEnd) << ")" << std::endl;
}

int main() {
    std::cout << "=== VADProcessor Tests ===" << std::endl;

    test_speech_segment();
    test_short_pause_keeps_segment();
    test_blip_ignored();
    test_short_speech_discarded();
    test_max_speech_forces_end();
    test_silence_timeout_setter();
    test_speaking_mode_raises_threshold();
    test_reset_drops_segment();
    test_calibration();
    test_calibration_clamps();
    test_calibration_cancel_keeps_threshold();
    test_webrtc_classifier();

    std::cout << "\nAll tests passed!" << std::endl;
    return 0;
}
