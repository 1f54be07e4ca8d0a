#pragma once

#include <functional>
#include <mutex>
#include <optional>
#include <string>

#include "microphone.hpp"
#include "audio_sink.hpp"
#include "chat_dispatcher.hpp"
#include "interruption.hpp"
#include "playback_scheduler.hpp"
#include "session.hpp"
#include "speech_session.hpp"
#include "transcription_channel.hpp"
#include "tts_stream.hpp"

struct ConversationConfig {
    PlaybackConfig playback;
    TtsConfig tts;
    InterruptionConfig interruption;
    SpeechConfig speech;
};

// The single active conversation: owns the pipeline components and wires
// them together. Devices and services come in through their seams.
class Conversation {
public:
    using TextListener = std::function<void(const std::string&)>;
    using ProfileListener = ChatDispatcher::CompletionListener;

    Conversation(AudioSink& sink,
                 SynthesisBackend& synthesis,
                 ChatBackend& chat,
                 TranscriptionChannel& channel,
                 MicrophoneSource& mic,
                 ConversationConfig cfg = {});
    // Detaches every listener before the workers wind down, so nothing calls
    // back into the owner once destruction starts.
    ~Conversation();

    Conversation(const Conversation&) = delete;
    Conversation& operator=(const Conversation&) = delete;

    // Throws ConnectionError when the channel or the microphone is unavailable.
    void start_listening();
    void stop_listening();

    void set_muted(bool muted);
    bool muted() const;

    // Back to onboarding with an empty log. Listening is left as it was.
    void reset();

    // Stops listening and cancels everything in flight. Idempotent.
    void shutdown();

    std::string status() const;

    void set_status_listener(TextListener listener);
    void set_preview_listener(TextListener listener);
    void set_transcript_listener(Session::TranscriptListener listener);
    void set_completion_listener(ProfileListener listener);

    Session& session() { return session_; }
    PlaybackScheduler& playback() { return playback_; }
    TtsStreamClient& tts() { return tts_; }
    InterruptionCoordinator& coordinator() { return coordinator_; }
    ChatDispatcher& dispatcher() { return dispatcher_; }
    SpeechSession& speech() { return speech_; }

private:
    void on_status(const std::string& text);
    std::string idle_status() const;

    // Outlives the workers below, which report status until they are joined.
    mutable std::mutex mutex_;
    std::string status_{"Tap to start"};
    TextListener status_listener_;

    // Declaration order is construction order; teardown runs in reverse.
    Session session_;
    PlaybackScheduler playback_;
    TtsStreamClient tts_;
    InterruptionCoordinator coordinator_;
    ChatDispatcher dispatcher_;
    SpeechSession speech_;
};
