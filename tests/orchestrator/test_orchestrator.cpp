/**
 * test_orchestrator.cpp - Orchestrator runtime tests
 *
 * Full conversations against in-memory devices, recognizer, voice and server.
 * The endpointer runs in energy-only mode so scripted levels drive it.
 */

#include "parley/Orchestrator.hpp"
#include "support/FakeComponents.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace parley;
using namespace parley::testing;

namespace {

constexpr float LOUD = 0.3f;

struct Rig {
    Config config;
    std::shared_ptr<FakeSource> source = std::make_shared<FakeSource>();
    std::shared_ptr<FakeSink> sink = std::make_shared<FakeSink>();
    std::shared_ptr<FakeRecognizer> recognizer = std::make_shared<FakeRecognizer>();
    std::shared_ptr<FakeSynthesizer> synthesizer = std::make_shared<FakeSynthesizer>();
    std::shared_ptr<FakeServer> server = std::make_shared<FakeServer>();

    Rig() {
        config.vad.webrtc_mode = -1;
        config.vad.threshold = 0.02f;
        config.vad.auto_calibrate = false;
        config.vad.frame_ms = 30;
        config.vad.speech_start_ms = 60;
        config.vad.silence_timeout_ms = 200;
        config.vad.min_speech_ms = 100;
        config.transport.heartbeat_interval_ms = 60000;
        config.transport.max_reconnect_attempts = 2;
        config.transport.reconnect_base_delay_ms = 1;
        config.conversation.resume_delay_ms = 0;
    }

    std::unique_ptr<Orchestrator> make() {
        Components components;
        components.source = source;
        components.sink = sink;
        components.recognizer = recognizer;
        components.synthesizer = synthesizer;
        components.connectionFactory = fakeFactory(server);
        return std::make_unique<Orchestrator>(config, std::move(components));
    }

    // Started and connected, ready for the first utterance
    void startAndConnect(Orchestrator& orchestrator) {
        assert(orchestrator.start());
        assert(waitUntil([&] { return source->running.load() && server->opens >= 1; }));
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }

    // Loud audio in 20ms chunks, paced so the event thread can open the recognizer
    void talk(int ms) {
        for (int t = 0; t < ms; t += 20) {
            source->feed(LOUD, 20);
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
        }
    }

    void silence(int ms) {
        for (int t = 0; t < ms; t += 20) {
            source->feed(0.0f, 20);
        }
    }

    // One spoken utterance ending with `transcript`
    void say(const std::string& transcript) {
        recognizer->nextFinal = transcript;
        talk(300);
        silence(300);
    }
};

std::string frame(const std::string& type, const std::string& field = "", const std::string& value = "") {
    if (field.empty()) return R"({"type":")" + type + R"("})";
    return R"({"type":")" + type + R"(",")" + field + R"(":")" + value + R"("})";
}

bool isTextFrame(const std::string& sent) {
    return sent.find(R"("type":"text")") != std::string::npos;
}

} // anonymous namespace

void test_full_conversation_turn() {
    Rig rig;
    FakeServer* server = rig.server.get();
    server->onClientFrame = [server](const std::string& sent) {
        if (!isTextFrame(sent)) return;
        server->push(frame("text_start"));
        server->push(frame("text_delta", "content", "It's "));
        server->push(frame("text_delta", "content", "3:45 PM"));
        server->push(frame("sentence_end", "sentence", "It's 3:45 PM."));
        server->push(frame("text_done", "full_text", "It's 3:45 PM."));
    };

    std::mutex mutex;
    std::vector<ConversationStateKind> states;
    std::vector<std::string> users;
    std::vector<std::string> assistants;

    auto orchestrator = rig.make();
    orchestrator->setCallbacks({
        .onStateChange = [&](const ConversationState& state) {
            std::lock_guard<std::mutex> lock(mutex);
            states.push_back(state.kind);
        },
        .onUserUtterance = [&](const std::string& text) {
            std::lock_guard<std::mutex> lock(mutex);
            users.push_back(text);
        },
        .onAssistantResponse = [&](const std::string& text) {
            std::lock_guard<std::mutex> lock(mutex);
            assistants.push_back(text);
        },
    });
    rig.startAndConnect(*orchestrator);

    rig.recognizer->nextFinal = "What time is it";
    rig.talk(100);
    assert(orchestrator->waitForState(ConversationStateKind::Listening, 1000));
    rig.talk(200);
    assert(rig.recognizer->samplesReceived() > 0);
    rig.silence(300);

    // The reply is short, so wait on the history rather than on speaking
    assert(waitUntil([&] { return orchestrator->messages().size() == 2; }, 3000));
    assert(orchestrator->waitForState(ConversationStateKind::Idle, 3000));

    const auto history = orchestrator->messages();
    assert(history.size() == 2);
    assert(history[0].role == Message::Role::User && history[0].content == "What time is it");
    assert(history[1].role == Message::Role::Assistant && history[1].content == "It's 3:45 PM.");

    assert(rig.server->countSent("What time is it") == 1);
    assert((rig.synthesizer->texts() == std::vector<std::string>{"It's 3:45 PM."}));
    assert(rig.sink->chunks == 1);

    {
        std::lock_guard<std::mutex> lock(mutex);
        const std::vector<ConversationStateKind> expected = {
            ConversationStateKind::Listening, ConversationStateKind::Processing,
            ConversationStateKind::Speaking, ConversationStateKind::Idle};
        assert(states == expected);
        assert(users.size() == 1 && assistants.size() == 1);
    }

    orchestrator->stop();
    assert(!rig.source->running);

    std::cout << "[PASS] test_full_conversation_turn" << std::endl;
}

void test_barge_in() {
    Rig rig;
    FakeServer* server = rig.server.get();
    const std::string story =
        "Once upon a time there was a very patient assistant who liked to explain things at length";
    std::atomic<int> turns{0};
    server->onClientFrame = [server, story, &turns](const std::string& sent) {
        if (!isTextFrame(sent)) return;
        if (++turns == 1) {
            server->push(frame("text_start"));
            server->push(frame("text_delta", "content", story));
            server->push(frame("sentence_end", "sentence", story));
        } else {
            server->push(frame("text_start"));
            server->push(frame("text_done", "full_text", "Okay."));
        }
    };

    auto orchestrator = rig.make();
    rig.startAndConnect(*orchestrator);

    rig.say("Tell me a story");
    assert(orchestrator->waitForState(ConversationStateKind::Speaking, 2000));
    assert(waitUntil([&] { return rig.sink->isPlaying(); }));

    // Recognizer gets no microphone audio while the assistant talks
    rig.recognizer->startRecognition();
    rig.source->feed(0.005f, 200);
    assert(rig.recognizer->samplesReceived() == 0);
    rig.recognizer->cancelRecognition();

    const int clearsBefore = rig.sink->clears;
    const int startsBefore = rig.recognizer->starts;
    const auto spokeAt = SteadyClock::now();
    rig.source->feed(LOUD, 90);

    assert(waitUntil([&] { return rig.sink->clears > clearsBefore; }, 500));
    const auto latency = std::chrono::duration_cast<std::chrono::milliseconds>(rig.sink->lastClear() - spokeAt);
    assert(latency.count() < 50);
    assert(!rig.sink->isPlaying());

    assert(orchestrator->waitForState(ConversationStateKind::Interrupted, 1000));
    assert(waitUntil([&] { return rig.recognizer->starts > startsBefore; }));
    // Playback was stopped before the new recognition opened
    assert(rig.recognizer->startedAt() >= rig.sink->lastClear());

    assert(waitUntil([&] { return rig.server->countSent(R"("type":"interrupt")") == 1; }));

    const auto history = orchestrator->messages();
    assert(history.size() == 2);
    assert(history[1].content == story + "... [interrupted]");

    // The interrupting utterance becomes the next turn
    rig.recognizer->nextFinal = "Never mind";
    rig.talk(200);
    rig.silence(300);
    assert(waitUntil([&] { return orchestrator->messages().size() == 4; }, 3000));
    assert(orchestrator->messages()[2].content == "Never mind");
    assert(orchestrator->messages()[3].content == "Okay.");
    assert(orchestrator->waitForState(ConversationStateKind::Idle, 3000));

    std::cout << "[PASS] test_barge_in (" << latency.count() << "ms)" << std::endl;
}

void test_echo_tail_ignored() {
    Rig rig;
    rig.config.conversation.resume_delay_ms = 400;
    FakeServer* server = rig.server.get();
    server->onClientFrame = [server](const std::string& sent) {
        if (!isTextFrame(sent)) return;
        server->push(frame("text_start"));
        server->push(frame("text_done", "full_text", "Sure."));
    };

    auto orchestrator = rig.make();
    rig.startAndConnect(*orchestrator);

    rig.say("Are you there");
    assert(waitUntil([&] { return orchestrator->messages().size() == 2; }, 3000));
    assert(orchestrator->waitForState(ConversationStateKind::Idle, 3000));
    const int starts = rig.recognizer->starts;

    // Within the resume delay, speech is treated as echo of the reply
    rig.source->feed(LOUD, 120);
    rig.silence(300);
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    assert(orchestrator->state().is(ConversationStateKind::Idle));
    assert(rig.recognizer->starts == starts);

    std::this_thread::sleep_for(std::chrono::milliseconds(400));
    rig.source->feed(LOUD, 120);
    assert(orchestrator->waitForState(ConversationStateKind::Listening, 1000));

    std::cout << "[PASS] test_echo_tail_ignored" << std::endl;
}

void test_speech_across_echo_window() {
    Rig rig;
    rig.config.conversation.resume_delay_ms = 300;
    FakeServer* server = rig.server.get();
    std::atomic<int> turns{0};
    server->onClientFrame = [server, &turns](const std::string& sent) {
        if (!isTextFrame(sent)) return;
        server->push(frame("text_start"));
        server->push(frame("text_done", "full_text", ++turns == 1 ? "Sure." : "Go on."));
    };

    auto orchestrator = rig.make();
    rig.startAndConnect(*orchestrator);

    rig.say("Are you there");
    assert(waitUntil([&] { return orchestrator->messages().size() == 2; }, 3000));
    assert(orchestrator->waitForState(ConversationStateKind::Idle, 3000));

    // Start talking inside the resume delay and keep going past it, in real time
    rig.recognizer->nextFinal = "I was saying";
    const auto began = SteadyClock::now();
    while (SteadyClock::now() - began < std::chrono::milliseconds(700)) {
        rig.source->feed(LOUD, 20);
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    assert(orchestrator->state().is(ConversationStateKind::Listening));
    rig.silence(300);

    assert(waitUntil([&] { return orchestrator->messages().size() == 4; }, 3000));
    assert(orchestrator->messages()[2].content == "I was saying");
    assert(orchestrator->messages()[3].content == "Go on.");

    std::cout << "[PASS] test_speech_across_echo_window" << std::endl;
}

void test_empty_transcript_resumes() {
    Rig rig;
    auto orchestrator = rig.make();
    rig.startAndConnect(*orchestrator);

    rig.say("");
    assert(waitUntil([&] { return rig.recognizer->stopsRequested == 1; }));
    assert(orchestrator->waitForState(ConversationStateKind::Idle, 1000));
    assert(orchestrator->messages().empty());
    assert(rig.server->countSent(R"("type":"text")") == 0);

    // Still listening for the next utterance
    rig.talk(100);
    assert(orchestrator->waitForState(ConversationStateKind::Listening, 1000));

    std::cout << "[PASS] test_empty_transcript_resumes" << std::endl;
}

void test_partial_transcripts() {
    Rig rig;
    std::mutex mutex;
    std::vector<std::string> partials;

    auto orchestrator = rig.make();
    orchestrator->setCallbacks({
        .onPartialTranscript = [&](const std::string& text) {
            std::lock_guard<std::mutex> lock(mutex);
            partials.push_back(text);
        },
    });
    rig.startAndConnect(*orchestrator);

    rig.talk(100);
    assert(orchestrator->waitForState(ConversationStateKind::Listening, 1000));
    rig.recognizer->emitPartial("turn on");
    rig.recognizer->emitPartial("turn on the lights");
    assert(waitUntil([&] { return orchestrator->partialTranscript() == "turn on the lights"; }));

    std::lock_guard<std::mutex> lock(mutex);
    assert((partials == std::vector<std::string>{"turn on", "turn on the lights"}));

    std::cout << "[PASS] test_partial_transcripts" << std::endl;
}

void test_push_to_talk() {
    Rig rig;
    rig.config.conversation.input_mode = InputMode::PushToTalk;
    FakeServer* server = rig.server.get();
    server->onClientFrame = [server](const std::string& sent) {
        if (!isTextFrame(sent)) return;
        server->push(frame("text_start"));
        server->push(frame("text_done", "full_text", "Done."));
    };

    auto orchestrator = rig.make();
    rig.startAndConnect(*orchestrator);
    assert(orchestrator->inputMode() == InputMode::PushToTalk);

    // Speech alone does not open a turn
    rig.talk(200);
    rig.silence(300);
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    assert(orchestrator->state().is(ConversationStateKind::Idle));

    rig.recognizer->nextFinal = "Set a timer";
    orchestrator->pushToTalkPress();
    assert(orchestrator->waitForState(ConversationStateKind::Listening, 1000));
    rig.talk(200);
    orchestrator->pushToTalkRelease();

    assert(waitUntil([&] { return orchestrator->messages().size() == 2; }, 3000));
    assert(orchestrator->messages()[0].content == "Set a timer");
    assert(orchestrator->waitForState(ConversationStateKind::Idle, 3000));

    orchestrator->setInputMode(InputMode::HandsFree);
    assert(waitUntil([&] { return orchestrator->inputMode() == InputMode::HandsFree; }));

    std::cout << "[PASS] test_push_to_talk" << std::endl;
}

void test_manual_interrupt() {
    Rig rig;
    FakeServer* server = rig.server.get();
    server->onClientFrame = [server](const std::string& sent) {
        if (!isTextFrame(sent)) return;
        server->push(frame("text_start"));
        server->push(frame("sentence_end", "sentence",
                           "This answer is long enough to still be playing when the user gives up on it."));
    };

    std::atomic<int> errors{0};
    auto orchestrator = rig.make();
    orchestrator->setCallbacks({.onError = [&](const Error&) { ++errors; }});
    rig.startAndConnect(*orchestrator);

    rig.say("Explain everything");
    assert(orchestrator->waitForState(ConversationStateKind::Speaking, 2000));

    orchestrator->interrupt();
    assert(orchestrator->waitForState(ConversationStateKind::Idle, 1000));
    assert(waitUntil([&] { return rig.server->countSent(R"("type":"interrupt")") == 1; }));
    assert(!rig.sink->isPlaying());
    assert(errors == 0);

    std::cout << "[PASS] test_manual_interrupt" << std::endl;
}

void test_clear_history() {
    Rig rig;
    FakeServer* server = rig.server.get();
    server->onClientFrame = [server](const std::string& sent) {
        if (!isTextFrame(sent)) return;
        server->push(frame("text_start"));
        server->push(frame("text_done", "full_text", "Noted."));
    };

    auto orchestrator = rig.make();
    rig.startAndConnect(*orchestrator);

    rig.say("Remember this");
    assert(waitUntil([&] { return orchestrator->messages().size() == 2; }, 3000));

    const std::string before = orchestrator->sessionId();
    orchestrator->clearHistory();
    assert(waitUntil([&] { return orchestrator->messages().empty(); }));
    assert(waitUntil([&] { return rig.server->countSent(R"("type":"clear")") == 1; }));
    assert(waitUntil([&] { return orchestrator->sessionId() != before; }));

    std::cout << "[PASS] test_clear_history" << std::endl;
}

void test_reconnect_exhaustion_enters_error() {
    Rig rig;
    rig.server->refuse = true;

    std::mutex mutex;
    std::vector<Error> errors;
    auto orchestrator = rig.make();
    orchestrator->setCallbacks({
        .onError = [&](const Error& error) {
            std::lock_guard<std::mutex> lock(mutex);
            errors.push_back(error);
        },
    });

    assert(orchestrator->start());
    assert(orchestrator->waitForState(ConversationStateKind::Error, 2000));
    assert(rig.server->opens == 3);
    assert(orchestrator->state().reason.find("reconnect attempts") != std::string::npos);

    // All audio paths are halted
    assert(waitUntil([&] { return !rig.source->running.load(); }));
    assert(!rig.sink->isPlaying());
    rig.source->running = true;
    rig.talk(200);
    rig.source->running = false;
    assert(orchestrator->state().is(ConversationStateKind::Error));

    {
        std::lock_guard<std::mutex> lock(mutex);
        assert(errors.size() == 1);
        assert(errors[0].kind == ErrorKind::Transport);
    }

    // Explicit restart recovers once the server is back
    rig.server->refuse = false;
    orchestrator->restart();
    assert(orchestrator->waitForState(ConversationStateKind::Idle, 1000));
    assert(waitUntil([&] { return rig.source->running.load() && rig.server->opens >= 4; }));

    std::cout << "[PASS] test_reconnect_exhaustion_enters_error" << std::endl;
}

void test_capture_failure_enters_error() {
    Rig rig;
    rig.source->failStart = true;

    auto orchestrator = rig.make();
    assert(orchestrator->start());
    assert(orchestrator->waitForState(ConversationStateKind::Error, 1000));
    assert(orchestrator->state().reason.find("audio capture unavailable") != std::string::npos);

    rig.source->failStart = false;
    orchestrator->restart();
    assert(orchestrator->waitForState(ConversationStateKind::Idle, 1000));
    assert(waitUntil([&] { return rig.source->running.load(); }));

    std::cout << "[PASS] test_capture_failure_enters_error" << std::endl;
}

void test_message_held_while_reconnecting() {
    Rig rig;
    rig.server->refuse = true;
    rig.config.transport.max_reconnect_attempts = 1000;
    rig.config.transport.reconnect_base_delay_ms = 20;
    FakeServer* server = rig.server.get();
    server->onClientFrame = [server](const std::string& sent) {
        if (!isTextFrame(sent)) return;
        server->push(frame("text_start"));
        server->push(frame("text_done", "full_text", "Hi there."));
    };

    std::atomic<int> errors{0};
    auto orchestrator = rig.make();
    orchestrator->setCallbacks({.onError = [&](const Error&) { ++errors; }});
    assert(orchestrator->start());
    assert(waitUntil([&] { return rig.source->running.load(); }));

    // The utterance waits for the link instead of failing the turn
    rig.say("Hello?");
    assert(orchestrator->waitForState(ConversationStateKind::Processing, 2000));
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    assert(orchestrator->state().is(ConversationStateKind::Processing));
    assert(rig.server->countSent("Hello?") == 0);

    rig.server->refuse = false;
    assert(waitUntil([&] { return orchestrator->messages().size() == 2; }, 3000));
    assert(rig.server->countSent("Hello?") == 1);
    assert(orchestrator->messages()[1].content == "Hi there.");
    assert(orchestrator->waitForState(ConversationStateKind::Idle, 3000));
    assert(errors == 0);

    std::cout << "[PASS] test_message_held_while_reconnecting" << std::endl;
}

void test_held_message_fails_when_link_gives_up() {
    Rig rig;
    rig.server->refuse = true;
    rig.config.transport.max_reconnect_attempts = 3;
    rig.config.transport.reconnect_base_delay_ms = 200;

    auto orchestrator = rig.make();
    assert(orchestrator->start());
    assert(waitUntil([&] { return rig.source->running.load(); }));

    rig.say("Hello?");
    assert(orchestrator->waitForState(ConversationStateKind::Processing, 1000));

    // Only the exhausted retry budget ends the turn
    assert(orchestrator->waitForState(ConversationStateKind::Error, 3000));
    assert(orchestrator->state().reason.find("reconnect attempts") != std::string::npos);
    assert(rig.server->opens == 4);
    assert(orchestrator->messages().size() == 1);
    assert(rig.server->countSent("Hello?") == 0);

    std::cout << "[PASS] test_held_message_fails_when_link_gives_up" << std::endl;
}

void test_send_failure_enters_error() {
    Rig rig;
    auto orchestrator = rig.make();
    rig.startAndConnect(*orchestrator);

    rig.server->failWrites = true;
    rig.say("Hello?");
    assert(orchestrator->waitForState(ConversationStateKind::Error, 2000));
    assert(orchestrator->state().reason == "could not send message: write failed");
    assert(orchestrator->messages().size() == 1);

    std::cout << "[PASS] test_send_failure_enters_error" << std::endl;
}

void test_synthesis_failure_enters_error() {
    Rig rig;
    FakeServer* server = rig.server.get();
    server->onClientFrame = [server](const std::string& sent) {
        if (!isTextFrame(sent)) return;
        server->push(frame("text_start"));
        server->push(frame("sentence_end", "sentence", "This will fail."));
    };

    auto orchestrator = rig.make();
    rig.startAndConnect(*orchestrator);

    rig.say("Say something");
    assert(orchestrator->waitForState(ConversationStateKind::Error, 2000));
    assert(orchestrator->state().reason == "speech synthesis failed: voice unavailable: test");
    assert(waitUntil([&] { return !rig.source->running.load(); }));

    std::cout << "[PASS] test_synthesis_failure_enters_error" << std::endl;
}

void test_start_stop() {
    Rig rig;
    auto orchestrator = rig.make();

    rig.startAndConnect(*orchestrator);
    assert(orchestrator->isRunning());
    assert(!orchestrator->start());

    orchestrator->stop();
    assert(!orchestrator->isRunning());
    assert(!rig.source->running);
    assert(rig.server->closes >= 1);
    assert(orchestrator->state().is(ConversationStateKind::Idle));

    orchestrator->stop();

    // A stopped runtime can be started again
    rig.startAndConnect(*orchestrator);
    assert(orchestrator->isRunning());

    std::cout << "[PASS] test_start_stop" << std::endl;
}

int main() {
    std::cout << "=== Orchestrator Tests ===" << std::endl;

    test_full_conversation_turn();
    test_barge_in();
    test_echo_tail_ignored();
    test_speech_across_echo_window();
    test_empty_transcript_resumes();
    test_partial_transcripts();
    test_push_to_talk();
    test_manual_interrupt();
    test_clear_history();
    test_reconnect_exhaustion_enters_error();
    test_capture_failure_enters_error();
    test_message_held_while_reconnecting();
    test_held_message_fails_when_link_gives_up();
    test_send_failure_enters_error();
    test_synthesis_failure_enters_error();
    test_start_stop();

    std::cout << "\nAll tests passed!" << std::endl;
    return 0;
}
