#pragma once

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "playback_scheduler.hpp"
#include "turn_token.hpp"

// Receives response bytes as they arrive; returning false stops the read.
using ByteSink = std::function<bool(const char* data, std::size_t len)>;

// Streaming speech synthesis service.
class SynthesisBackend {
public:
    virtual ~SynthesisBackend() = default;

    // Streams raw 24 kHz S16LE PCM for text into on_bytes. Throws BackendError
    // on a non-success response and CancellationError once token fires.
    virtual void synthesize(const std::string& text, const TurnToken& token, const ByteSink& on_bytes) = 0;
};

// Cuts a byte stream into playable chunks of at least min_bytes, always on a
// sample boundary. Smaller remainders carry over to the next read.
class PcmChunker {
public:
    explicit PcmChunker(std::size_t min_bytes = 24000) : min_bytes_(min_bytes) {}

    std::optional<std::vector<uint8_t>> feed(const char* data, std::size_t len);

    // End of stream: whatever is left, if it holds at least one sample.
    std::optional<std::vector<uint8_t>> flush();

    std::size_t buffered() const { return leftover_.size(); }

private:
    std::size_t min_bytes_;
    std::vector<uint8_t> leftover_;
};

struct TtsConfig {
    std::size_t min_buffer_bytes = 24000; // 500 ms at 24 kHz, 16-bit mono
};

// Sentence queue plus the single drain worker that synthesizes sentences one
// request at a time and feeds the playback scheduler as audio arrives.
class TtsStreamClient {
public:
    TtsStreamClient(SynthesisBackend& backend, PlaybackScheduler& scheduler, TtsConfig cfg = {});
    ~TtsStreamClient();

    TtsStreamClient(const TtsStreamClient&) = delete;
    TtsStreamClient& operator=(const TtsStreamClient&) = delete;

    void enqueue(std::string sentence, TurnTokenPtr token);

    // Empties the sentence queue. The sentence being synthesized is aborted
    // through its turn token, not here.
    void clear();

    // A sentence is queued or being synthesized.
    bool busy() const;
    std::size_t pending() const;

private:
    struct Entry {
        std::string sentence;
        TurnTokenPtr token;
    };

    void drain();
    void speak_sentence(const Entry& entry);

    SynthesisBackend& backend_;
    PlaybackScheduler& scheduler_;
    TtsConfig cfg_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Entry> queue_;
    bool draining_{false};
    bool shutdown_{false};

    std::thread worker_;
};
