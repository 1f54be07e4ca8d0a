#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>

#include "playback_scheduler.hpp"
#include "tts_stream.hpp"
#include "turn_token.hpp"

struct InterruptionConfig {
    std::chrono::milliseconds echo_cooldown{1000};
};

// Owns the current turn token and the echo cooldown deadline, and performs
// the composite cancellation used for barge-in: abort the turn's network
// calls, empty the sentence and chunk queues, halt playback.
class InterruptionCoordinator {
public:
    using Clock = std::chrono::steady_clock;
    using NowFn = std::function<Clock::time_point()>;

    InterruptionCoordinator(TtsStreamClient& tts,
                            PlaybackScheduler& playback,
                            InterruptionConfig cfg = {},
                            NowFn now = nullptr);
    ~InterruptionCoordinator();

    InterruptionCoordinator(const InterruptionCoordinator&) = delete;
    InterruptionCoordinator& operator=(const InterruptionCoordinator&) = delete;

    // Cancels whatever the previous turn left running and issues a fresh token.
    TurnTokenPtr begin_turn();

    // The turn's chat request returned (its speech may still be playing).
    void end_request(const TurnTokenPtr& token);

    TurnTokenPtr current_turn() const;

    // Composite cancellation. Safe to call repeatedly and with no active turn.
    // Returns true if the assistant was speaking or about to speak.
    bool interrupt();

    // Chat request in flight, sentences pending synthesis, or audio playing.
    bool assistant_active() const;

    // Playback ran dry or was stopped: start the echo cooldown window.
    void on_playback_idle();

    bool in_echo_cooldown() const;
    bool in_echo_cooldown(Clock::time_point now) const;
    std::optional<Clock::time_point> cooldown_deadline() const;
    void clear_cooldown();

private:
    TtsStreamClient& tts_;
    PlaybackScheduler& playback_;
    InterruptionConfig cfg_;
    NowFn now_;

    mutable std::mutex mutex_;
    TurnTokenPtr current_;
    bool request_in_flight_{false};
    std::uint64_t next_id_{1};
    std::optional<Clock::time_point> cooldown_until_;
};
