#include "conversation.hpp"

#include "utils.hpp"

Conversation::Conversation(AudioSink& sink,
                           SynthesisBackend& synthesis,
                           ChatBackend& chat,
                           TranscriptionChannel& channel,
                           MicrophoneSource& mic,
                           ConversationConfig cfg)
    : playback_(sink, cfg.playback),
      tts_(synthesis, playback_, cfg.tts),
      coordinator_(tts_, playback_, cfg.interruption),
      dispatcher_(chat, session_, tts_, coordinator_),
      speech_(channel, mic, coordinator_, cfg.speech) {
    speech_.set_utterance_handler([this](const std::string& text) { dispatcher_.enqueue(text); });
    speech_.set_status_listener([this](const std::string& text) { on_status(text); });
    dispatcher_.set_status_listener([this](const std::string& text) { on_status(text); });
    dispatcher_.set_idle_status([this] { return idle_status(); });
}

Conversation::~Conversation() {
    set_status_listener(nullptr);
    speech_.set_preview_listener(nullptr);
    session_.set_transcript_listener(nullptr);
    dispatcher_.set_completion_listener(nullptr);
    shutdown();
}

void Conversation::start_listening() {
    speech_.start();
}

void Conversation::stop_listening() {
    speech_.stop();
    dispatcher_.stop();
    coordinator_.interrupt();
    on_status("Tap to start");
}

void Conversation::set_muted(bool muted) {
    speech_.set_muted(muted);
}

bool Conversation::muted() const {
    return speech_.muted();
}

void Conversation::reset() {
    // Speech first: an utterance still in flight must not reach the fresh session.
    speech_.discard_pending();
    dispatcher_.stop();
    coordinator_.interrupt();
    coordinator_.clear_cooldown();
    session_.reset();
    log_info("Conversation", "Reset to onboarding");
    on_status(idle_status());
}

void Conversation::shutdown() {
    speech_.stop();
    dispatcher_.stop();
    coordinator_.interrupt();
}

std::string Conversation::status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return status_;
}

void Conversation::set_status_listener(TextListener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    status_listener_ = std::move(listener);
}

void Conversation::set_preview_listener(TextListener listener) {
    speech_.set_preview_listener(std::move(listener));
}

void Conversation::set_transcript_listener(Session::TranscriptListener listener) {
    session_.set_transcript_listener(std::move(listener));
}

void Conversation::set_completion_listener(ProfileListener listener) {
    dispatcher_.set_completion_listener(std::move(listener));
}

void Conversation::on_status(const std::string& text) {
    TextListener listener;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (status_ == text) return;
        status_ = text;
        listener = status_listener_;
    }
    if (listener) listener(text);
}

std::string Conversation::idle_status() const {
    if (speech_.state() != SpeechState::Listening) return "Tap to start";
    return speech_.muted() ? "Muted" : "Listening...";
}
