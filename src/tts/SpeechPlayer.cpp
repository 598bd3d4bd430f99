/**
 * SpeechPlayer.cpp - Streaming speech output
 *
 * Worker pipeline: take a unit, synthesize it, queue it on the sink and move on
 * to the next unit while it plays. Every stop() bumps the generation so results
 * from an earlier stream are discarded when they come back.
 */

#include "parley/tts/SpeechPlayer.hpp"
#include "parley/audio/Wav.hpp"

#include <atomic>
#include <cctype>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <iostream>
#include <mutex>
#include <thread>

namespace parley::tts {

namespace {

constexpr auto DRAIN_POLL = std::chrono::milliseconds(10);

bool isBoundary(char c) {
    return c == '.' || c == '!' || c == '?' || c == ';';
}

bool isSpace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::string trim(const std::string& s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && isSpace(s[begin])) ++begin;
    while (end > begin && isSpace(s[end - 1])) --end;
    return s.substr(begin, end - begin);
}

} // anonymous namespace

struct SpeechPlayer::Impl {
    std::shared_ptr<Synthesizer> synthesizer;
    std::shared_ptr<audio::AudioSink> sink;
    TtsConfig config;

    mutable std::mutex mutex;
    std::condition_variable cv;
    PlayerCallbacks callbacks;

    std::deque<std::string> queue;  // Units waiting for synthesis
    std::string pending;            // Fragment text not yet forming a unit
    std::atomic<uint64_t> generation{0};
    bool streamOpen = false;
    bool started = false;       // onSpeakingStart fired for this stream
    bool endRequested = false;  // Stream closed, onSpeakingEnd owed
    bool busy = false;          // Worker is synthesizing a unit
    bool shutdown = false;

    std::thread worker;

    Impl(std::shared_ptr<Synthesizer> synth, std::shared_ptr<audio::AudioSink> out, const TtsConfig& cfg)
        : synthesizer(std::move(synth))
        , sink(std::move(out))
        , config(cfg) {}

    size_t maxChars() const {
        return config.max_chunk_chars > 0 ? static_cast<size_t>(config.max_chunk_chars) : std::string::npos;
    }

    // Called with the lock held
    void enqueue(std::vector<std::string> units) {
        for (auto& unit : units) {
            std::string cleaned = cleanText(unit);
            if (!cleaned.empty()) {
                queue.push_back(std::move(cleaned));
            }
        }
    }

    // Called with the lock held
    void pushPendingAll() {
        enqueue(takeUtterances(pending, maxChars()));
        std::string rest = trim(pending);
        pending.clear();
        if (!rest.empty()) {
            enqueue({rest});
        }
    }

    // Called with the lock held
    void resetStream() {
        queue.clear();
        pending.clear();
        streamOpen = false;
        started = false;
        endRequested = false;
    }

    bool endDue() const {
        return endRequested && !streamOpen && queue.empty();
    }

    // Keeps synthesis at most max_queued_ms ahead of the speaker. Returns false if stopped
    bool waitForRoom(size_t count, uint64_t gen) const {
        if (config.max_queued_ms <= 0) return gen == generation;
        const size_t limit = static_cast<size_t>(sink->sampleRate()) * config.max_queued_ms / 1000;
        while (gen == generation) {
            const size_t queued = sink->pendingSamples();
            if (queued == 0 || queued + count <= limit) {
                return true;
            }
            std::this_thread::sleep_for(DRAIN_POLL);
        }
        return false;
    }

    void run() {
        std::unique_lock<std::mutex> lock(mutex);

        while (true) {
            cv.wait(lock, [this] { return shutdown || !queue.empty() || endDue(); });
            if (shutdown) break;

            const uint64_t gen = generation;

            if (!queue.empty()) {
                std::string text = std::move(queue.front());
                queue.pop_front();
                busy = true;

                lock.unlock();
                SynthesisResult result = synthesizer->synthesize(text);
                lock.lock();
                busy = false;

                if (gen != generation) {
                    continue;  // Stopped while synthesizing
                }

                if (!result.ok()) {
                    std::cerr << "[SpeechPlayer] Synthesis failed: " << result.error << std::endl;
                    resetStream();
                    auto onError = callbacks.onError;
                    lock.unlock();
                    sink->clearPlayback();
                    if (onError) onError(result.error);
                    lock.lock();
                    continue;
                }

                std::vector<float> samples = std::move(result.samples);
                if (result.sample_rate > 0 && result.sample_rate != sink->sampleRate()) {
                    samples = audio::resample(samples, result.sample_rate, sink->sampleRate());
                }

                const bool first = !started;
                started = true;
                auto onStart = callbacks.onSpeakingStart;

                lock.unlock();
                if (!waitForRoom(samples.size(), gen)) {
                    lock.lock();
                    continue;  // Stopped while waiting for the sink
                }
                if (!samples.empty()) {
                    sink->queuePlayback(samples.data(), samples.size());
                }
                if (first) {
                    std::cout << "[SpeechPlayer] Speaking: \"" << text << "\"" << std::endl;
                    if (onStart) onStart();
                }
                lock.lock();
                continue;
            }

            // Stream closed and nothing left to synthesize: wait for the sink to drain
            lock.unlock();
            while (sink->isPlaying() && gen == generation) {
                std::this_thread::sleep_for(DRAIN_POLL);
            }
            lock.lock();

            if (gen != generation || !endDue()) {
                continue;
            }

            started = false;
            endRequested = false;
            auto onEnd = callbacks.onSpeakingEnd;
            lock.unlock();
            std::cout << "[SpeechPlayer] Finished speaking" << std::endl;
            if (onEnd) onEnd();
            lock.lock();
        }
    }
};

SpeechPlayer::SpeechPlayer(std::shared_ptr<Synthesizer> synthesizer,
                           std::shared_ptr<audio::AudioSink> sink,
                           const TtsConfig& config)
    : impl_(std::make_unique<Impl>(std::move(synthesizer), std::move(sink), config)) {
    impl_->worker = std::thread([this] { impl_->run(); });
}

SpeechPlayer::~SpeechPlayer() {
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        impl_->shutdown = true;
        ++impl_->generation;
    }
    impl_->synthesizer->cancel();
    impl_->cv.notify_all();
    if (impl_->worker.joinable()) {
        impl_->worker.join();
    }
}

void SpeechPlayer::setCallbacks(PlayerCallbacks callbacks) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->callbacks = std::move(callbacks);
}

void SpeechPlayer::speak(const std::string& text) {
    stop();
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        impl_->pending = text;
        impl_->pushPendingAll();
        impl_->streamOpen = false;
        impl_->endRequested = true;
    }
    impl_->cv.notify_all();
}

void SpeechPlayer::speakSentence(const std::string& sentence) {
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        impl_->streamOpen = true;
        impl_->endRequested = false;
        if (!impl_->pending.empty() && !isSpace(impl_->pending.back())) {
            impl_->pending += ' ';
        }
        impl_->pending += sentence;
        impl_->pushPendingAll();
    }
    impl_->cv.notify_all();
}

void SpeechPlayer::speakStreaming(const std::string& fragment) {
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        impl_->streamOpen = true;
        impl_->endRequested = false;
        impl_->pending += fragment;
        impl_->enqueue(takeUtterances(impl_->pending, impl_->maxChars()));
    }
    impl_->cv.notify_all();
}

void SpeechPlayer::flush() {
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        impl_->pushPendingAll();
        impl_->streamOpen = false;
        impl_->endRequested = true;
    }
    impl_->cv.notify_all();
}

void SpeechPlayer::stop() {
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        ++impl_->generation;
        impl_->resetStream();
    }
    impl_->synthesizer->cancel();
    impl_->sink->clearPlayback();
    impl_->cv.notify_all();
}

bool SpeechPlayer::isSpeaking() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->started || impl_->busy || !impl_->queue.empty();
}

std::vector<std::string> SpeechPlayer::takeUtterances(std::string& pending, size_t max_chars) {
    std::vector<std::string> units;

    while (!pending.empty()) {
        size_t cut = std::string::npos;
        const size_t limit = std::min(pending.size(), max_chars);

        for (size_t i = 0; i < limit; ++i) {
            const char c = pending[i];
            if (c == '\n') {
                cut = i + 1;
                break;
            }
            // Require trailing whitespace so "3.5" is not split mid-stream
            if (isBoundary(c) && i + 1 < pending.size() && isSpace(pending[i + 1])) {
                cut = i + 1;
                break;
            }
        }

        if (cut == std::string::npos) {
            if (pending.size() <= max_chars) {
                break;
            }
            const size_t ws = pending.find_last_of(" \t", max_chars);
            cut = (ws == std::string::npos || ws == 0) ? max_chars : ws;
        }

        std::string unit = trim(pending.substr(0, cut));
        pending.erase(0, cut);
        if (!unit.empty()) {
            units.push_back(std::move(unit));
        }
    }

    return units;
}

std::string SpeechPlayer::cleanText(const std::string& text) {
    std::string out;
    out.reserve(text.size());

    bool space = false;
    for (char c : text) {
        if (c == '*' || c == '#' || c == '`' || c == '~') {
            continue;
        }
        if (isSpace(c)) {
            space = !out.empty();
            continue;
        }
        if (space) {
            out += ' ';
            space = false;
        }
        out += c;
    }
    return out;
}

} // namespace parley::tts
