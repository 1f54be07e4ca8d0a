#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "microphone.hpp"
#include "interruption.hpp"
#include "transcription_channel.hpp"

struct SpeechConfig {
    std::chrono::milliseconds silence_timeout{2500}; // fallback when no utterance-end arrives
};

enum class SpeechState { Idle, Connecting, Listening, Closed };

const char* speech_state_name(SpeechState state);

// Owns the live transcription channel and the microphone, accumulates final
// transcript fragments and decides when a user utterance is done.
//
// Channel events and silence-timer fires are queued as messages and handled
// in order on one event thread.
class SpeechSession {
public:
    using UtteranceHandler = std::function<void(const std::string&)>;
    using TextListener = std::function<void(const std::string&)>;

    SpeechSession(TranscriptionChannel& channel,
                  MicrophoneSource& mic,
                  InterruptionCoordinator& coordinator,
                  SpeechConfig cfg = {});
    ~SpeechSession();

    SpeechSession(const SpeechSession&) = delete;
    SpeechSession& operator=(const SpeechSession&) = delete;

    // Opens the channel and starts streaming captured audio. Throws
    // ConnectionError; starting an already live session is an error.
    void start();

    // Closes the channel and releases the microphone exactly once, drops the
    // pending silence timer and the buffered fragments. Idempotent.
    void stop();

    void set_muted(bool muted);
    bool muted() const;
    SpeechState state() const;

    // Live "current input" preview; not persisted.
    std::string current_input() const;
    std::vector<std::string> buffered() const;
    bool silence_timer_armed() const;

    void set_utterance_handler(UtteranceHandler handler);
    void set_preview_listener(TextListener listener);
    void set_status_listener(TextListener listener);

    // Entry point for channel events; safe from any thread.
    void post(const TranscriptEvent& event);

    // Blocks until every posted event has been handled.
    void drain_events();

    // Drops posted but unhandled events, the buffered fragments and the
    // silence timer, then waits out an event already being handled. The
    // session keeps listening. Not for use from a listener callback.
    void discard_pending();

private:
    void run();
    void handle(const TranscriptEvent& event);
    void complete_utterance(const char* reason);
    void capture_loop();
    void release();
    void arm_silence_timer();
    void publish_preview(const std::string& text);
    void status(const std::string& text);

    TranscriptionChannel& channel_;
    MicrophoneSource& mic_;
    InterruptionCoordinator& coordinator_;
    SpeechConfig cfg_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::condition_variable idle_cv_;
    std::deque<TranscriptEvent> events_;
    bool handling_{false};
    bool shutdown_{false};
    std::optional<std::chrono::steady_clock::time_point> silence_deadline_;

    SpeechState state_{SpeechState::Idle};
    bool muted_{false};
    std::vector<std::string> buffer_;
    std::string current_input_;

    UtteranceHandler utterance_handler_;
    TextListener preview_listener_;
    TextListener status_listener_;

    std::mutex release_mutex_;
    bool resources_held_{false};
    std::atomic<bool> capturing_{false};
    std::thread capture_thread_;

    std::thread event_thread_;
};
