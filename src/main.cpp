/**
 * Parley - Main Entry Point
 *
 * Spoken conversation client for a remote assistant server.
 *
 * Usage: parley [config.json] [--list-devices]
 */

#include "parley/Config.hpp"
#include "parley/Orchestrator.hpp"
#include "parley/audio/AudioEngine.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstring>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

std::atomic<bool> g_running{true};

void signalHandler(int /*signal*/) {
    g_running = false;
}

namespace {

void printHelp() {
    std::cout << "Commands:\n"
              << "  p  press / release push-to-talk\n"
              << "  m  toggle hands-free / push-to-talk\n"
              << "  c  clear conversation\n"
              << "  k  calibrate microphone (stay quiet)\n"
              << "  r  restart after an error\n"
              << "  i  interrupt the assistant\n"
              << "  q  quit" << std::endl;
}

void listDevices() {
    std::cout << "Input devices:" << std::endl;
    int index = 0;
    for (const auto& name : parley::audio::AudioEngine::listInputDevices()) {
        std::cout << "  [" << index++ << "] " << name << std::endl;
    }
    std::cout << "Output devices:" << std::endl;
    index = 0;
    for (const auto& name : parley::audio::AudioEngine::listOutputDevices()) {
        std::cout << "  [" << index++ << "] " << name << std::endl;
    }
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    std::string config_path;
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--list-devices") == 0) {
            listDevices();
            return 0;
        }
        config_path = argv[i];
    }

    std::cout << "[Parley] Starting..." << std::endl;

    parley::Config config;
    if (!config_path.empty()) {
        std::string error;
        if (!parley::loadConfig(config_path, config, error)) {
            std::cerr << "[Parley] " << parley::toString(parley::ErrorKind::Configuration)
                      << ": " << error << std::endl;
            return 1;
        }
    }

    // Shared with the input thread, which may outlive main's scope
    std::shared_ptr<parley::Orchestrator> orchestrator = parley::Orchestrator::createDefault(config);

    parley::OrchestratorCallbacks callbacks;
    callbacks.onStateChange = [](const parley::ConversationState& state) {
        std::cout << "[Parley] State: " << parley::describe(state) << std::endl;
    };
    callbacks.onPartialTranscript = [](const std::string& text) {
        std::cout << "[Parley] ... " << text << std::endl;
    };
    callbacks.onUserUtterance = [](const std::string& text) {
        std::cout << "[Parley] You: " << text << std::endl;
    };
    callbacks.onAssistantResponse = [](const std::string& text) {
        std::cout << "[Parley] Assistant: " << text << std::endl;
    };
    callbacks.onError = [](const parley::Error& error) {
        std::cerr << "[Parley] " << parley::toString(error.kind) << ": " << error.message << std::endl;
    };
    callbacks.onCalibrationProgress = [](float progress, bool finished) {
        if (finished) {
            std::cout << "[Parley] Calibration complete" << std::endl;
        } else {
            std::cout << "\r[Parley] Calibrating " << static_cast<int>(progress * 100) << "%" << std::flush;
        }
    };
    orchestrator->setCallbacks(std::move(callbacks));

    if (!orchestrator->start()) {
        std::cerr << "[Parley] Failed to start" << std::endl;
        return 1;
    }

    printHelp();

    // stdin is read on its own thread so signals still end the main loop
    std::thread input([orchestrator] {
        bool talking = false;
        std::string line;
        while (g_running && std::getline(std::cin, line)) {
            if (!g_running) break;
            if (line.empty()) continue;
            switch (line[0]) {
                case 'p':
                    talking = !talking;
                    if (talking) orchestrator->pushToTalkPress();
                    else orchestrator->pushToTalkRelease();
                    break;
                case 'm': {
                    const auto next = orchestrator->inputMode() == parley::InputMode::HandsFree
                        ? parley::InputMode::PushToTalk
                        : parley::InputMode::HandsFree;
                    orchestrator->setInputMode(next);
                    std::cout << "[Parley] Mode: " << parley::toString(next) << std::endl;
                    break;
                }
                case 'c': orchestrator->clearHistory(); break;
                case 'k': orchestrator->startCalibration(); break;
                case 'r': orchestrator->restart(); break;
                case 'i': orchestrator->interrupt(); break;
                case 'q': g_running = false; break;
                default: printHelp(); break;
            }
        }
    });
    input.detach();

    while (g_running) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    std::cout << "\n[Parley] Shutting down..." << std::endl;
    orchestrator->stop();
    std::cout << "[Parley] Goodbye!" << std::endl;
    return 0;
}
