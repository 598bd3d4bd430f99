/**
 * test_level_monitor.cpp - Level meter tests
 */

#include "parley/audio/LevelMonitor.hpp"
#include <cassert>
#include <cmath>
#include <iostream>
#include <vector>

using namespace parley::audio;

void test_rms() {
    std::vector<float> constant(480, 0.5f);
    assert(std::fabs(LevelMonitor::rms(constant.data(), constant.size()) - 0.5f) < 1e-6f);

    std::vector<float> square = {0.25f, -0.25f, 0.25f, -0.25f};
    assert(std::fabs(LevelMonitor::rms(square.data(), square.size()) - 0.25f) < 1e-6f);

    assert(LevelMonitor::rms(nullptr, 10) == 0.0f);
    assert(LevelMonitor::rms(constant.data(), 0) == 0.0f);

    std::cout << "[PASS] test_rms" << std::endl;
}

void test_smoothing() {
    LevelMonitor monitor(2);
    std::vector<float> quiet(256, 0.05f);
    std::vector<float> silent(256, 0.0f);

    float level = monitor.process(quiet.data(), quiet.size());
    assert(std::fabs(level - 0.5f) < 1e-5f);
    assert(std::fabs(monitor.level() - 0.5f) < 1e-5f);

    // Average of 0.05 and 0.0
    level = monitor.process(silent.data(), silent.size());
    assert(std::fabs(level - 0.25f) < 1e-5f);

    // 0.05 has left the window
    level = monitor.process(silent.data(), silent.size());
    assert(level < 1e-5f);

    std::cout << "[PASS] test_smoothing" << std::endl;
}

void test_clamped_and_reset() {
    LevelMonitor monitor;
    std::vector<float> loud(256, 0.9f);

    assert(monitor.process(loud.data(), loud.size()) == 1.0f);
    assert(monitor.level() == 1.0f);

    monitor.reset();
    assert(monitor.level() == 0.0f);

    std::cout << "[PASS] test_clamped_and_reset" << std::endl;
}

int main() {
    std::cout << "=== LevelMonitor Tests ===" << std::endl;

    test_rms();
    test_smoothing();
    test_clamped_and_reset();

    std::cout << "\nAll tests passed!" << std::endl;
    return 0;
}
