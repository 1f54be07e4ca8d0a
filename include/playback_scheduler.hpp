#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

#include "audio_sink.hpp"
#include "turn_token.hpp"

struct PlaybackConfig {
    int sample_rate = 24000;        // rate of the synthesized PCM
    std::size_t fade_samples = 48;  // ~2 ms ramps against boundary clicks
};

// Plays ordered S16LE chunks back to back on an AudioSink.
//
// Each chunk starts exactly where the previous one ends on the playback
// clock; the clock is raised to the sink's current time if it fell behind.
// A single consumer thread plays one chunk at a time.
class PlaybackScheduler {
public:
    using IdleCallback = std::function<void()>;

    explicit PlaybackScheduler(AudioSink& sink, PlaybackConfig cfg = {});
    ~PlaybackScheduler();

    PlaybackScheduler(const PlaybackScheduler&) = delete;
    PlaybackScheduler& operator=(const PlaybackScheduler&) = delete;

    // Queues a chunk for playback. Chunks of an already cancelled turn are dropped.
    void enqueue(std::vector<uint8_t> pcm, const TurnTokenPtr& token = nullptr);

    // Halts the sounding chunk, drops audio still queued on the device,
    // discards the queue and unsets the clock. Idempotent.
    void stop();

    // Called whenever playback goes idle, whether the queue ran dry and the
    // device drained or stop() cut it. Returns once no previous callback is
    // still running, so the old target may be destroyed afterwards.
    void set_on_idle(IdleCallback cb);

    bool is_playing() const;
    std::size_t queued() const;
    std::optional<double> next_start() const;
    const PlaybackConfig& config() const { return cfg_; }

    // S16LE bytes to normalized floats with linear fade-in/fade-out ramps.
    static std::vector<float> decode(const std::vector<uint8_t>& pcm, std::size_t fade_samples);

private:
    void consume();
    void notify_idle();

    AudioSink& sink_;
    PlaybackConfig cfg_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::vector<uint8_t>> queue_;
    std::optional<double> next_start_;
    bool playing_{false};
    bool shutdown_{false};
    std::atomic<bool> halt_{false};
    std::atomic<bool> wake_{false};
    IdleCallback on_idle_;
    int idle_callbacks_{0};
    std::condition_variable idle_cv_;

    std::thread worker_;
};
