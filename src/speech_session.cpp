#include "speech_session.hpp"

#include "errors.hpp"
#include "utils.hpp"

const char* speech_state_name(SpeechState state) {
    switch (state) {
    case SpeechState::Idle: return "idle";
    case SpeechState::Connecting: return "connecting";
    case SpeechState::Listening: return "listening";
    case SpeechState::Closed: return "closed";
    }
    return "idle";
}

SpeechSession::SpeechSession(TranscriptionChannel& channel,
                             MicrophoneSource& mic,
                             InterruptionCoordinator& coordinator,
                             SpeechConfig cfg)
    : channel_(channel), mic_(mic), coordinator_(coordinator), cfg_(cfg) {
    event_thread_ = std::thread(&SpeechSession::run, this);
}

SpeechSession::~SpeechSession() {
    stop();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        shutdown_ = true;
        events_.clear();
    }
    cv_.notify_all();
    if (event_thread_.joinable()) {
        event_thread_.join();
    }
}

void SpeechSession::start() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == SpeechState::Connecting || state_ == SpeechState::Listening) {
            throw std::runtime_error("Speech session already started");
        }
        state_ = SpeechState::Connecting;
        buffer_.clear();
        current_input_.clear();
        silence_deadline_.reset();
    }
    status("Connecting...");

    try {
        channel_.open([this](const TranscriptEvent& event) { post(event); });
    } catch (const std::exception& e) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            state_ = SpeechState::Closed;
        }
        log_error("Speech", std::string("Channel unavailable: ") + e.what());
        status("Connection error");
        throw ConnectionError(e.what());
    }

    try {
        mic_.start();
    } catch (const std::exception& e) {
        channel_.close();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            state_ = SpeechState::Closed;
        }
        log_error("Speech", std::string("Microphone unavailable: ") + e.what());
        status("Microphone access denied");
        throw ConnectionError(std::string("Microphone access denied: ") + e.what());
    }

    bool muted = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        muted = muted_;
        state_ = SpeechState::Listening;
    }
    mic_.set_enabled(!muted);

    {
        std::lock_guard<std::mutex> lock(release_mutex_);
        resources_held_ = true;
        capturing_ = true;
        capture_thread_ = std::thread(&SpeechSession::capture_loop, this);
    }
    log_info("Speech", "Listening");
    status(muted ? "Muted" : "Listening...");
}

void SpeechSession::stop() {
    release();

    bool was_live = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        was_live = state_ == SpeechState::Connecting || state_ == SpeechState::Listening;
        if (was_live) state_ = SpeechState::Closed;
        silence_deadline_.reset();
        buffer_.clear();
        current_input_.clear();
    }
    if (was_live) {
        log_info("Speech", "Stopped");
        publish_preview({});
    }
}

void SpeechSession::release() {
    std::lock_guard<std::mutex> lock(release_mutex_);
    if (!resources_held_) return;
    resources_held_ = false;

    capturing_ = false;
    if (capture_thread_.joinable()) {
        capture_thread_.join();
    }
    mic_.stop();
    channel_.close();
}

void SpeechSession::capture_loop() {
    std::vector<int16_t> frames;
    while (capturing_) {
        try {
            if (mic_.read(frames) == 0) continue;
            channel_.send_audio(frames.data(), frames.size());
        } catch (const std::exception& e) {
            log_error("Speech", std::string("Capture error: ") + e.what());
            post({TranscriptEvent::Kind::Error, e.what()});
            break;
        }
    }
}

void SpeechSession::set_muted(bool muted) {
    bool live = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        muted_ = muted;
        live = state_ == SpeechState::Listening;
    }
    // Track-level disable: capture keeps feeding silence so the channel stays warm.
    {
        std::lock_guard<std::mutex> lock(release_mutex_);
        if (resources_held_) mic_.set_enabled(!muted);
    }
    status(muted ? "Muted" : live ? "Listening..." : "Tap to start");
}

bool SpeechSession::muted() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return muted_;
}

SpeechState SpeechSession::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::string SpeechSession::current_input() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_input_;
}

std::vector<std::string> SpeechSession::buffered() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return buffer_;
}

bool SpeechSession::silence_timer_armed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return silence_deadline_.has_value();
}

void SpeechSession::set_utterance_handler(UtteranceHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    utterance_handler_ = std::move(handler);
}

void SpeechSession::set_preview_listener(TextListener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    preview_listener_ = std::move(listener);
}

void SpeechSession::set_status_listener(TextListener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    status_listener_ = std::move(listener);
}

void SpeechSession::post(const TranscriptEvent& event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutdown_) return;
        events_.push_back(event);
    }
    cv_.notify_one();
}

void SpeechSession::drain_events() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_cv_.wait(lock, [this] { return (events_.empty() && !handling_) || shutdown_; });
}

void SpeechSession::discard_pending() {
    std::size_t dropped = 0;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        dropped = events_.size();
        events_.clear();
        buffer_.clear();
        current_input_.clear();
        silence_deadline_.reset();
        idle_cv_.wait(lock, [this] { return !handling_ || shutdown_; });
        // The event in flight may have buffered a fragment before finishing.
        buffer_.clear();
        current_input_.clear();
        silence_deadline_.reset();
    }
    if (dropped > 0) {
        log_info("Speech", "Discarded " + std::to_string(dropped) + " pending events");
    }
    publish_preview({});
}

void SpeechSession::run() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!shutdown_) {
        if (events_.empty()) {
            idle_cv_.notify_all();
            if (silence_deadline_) {
                cv_.wait_until(lock, *silence_deadline_, [this] { return !events_.empty() || shutdown_; });
            } else {
                cv_.wait(lock, [this] { return !events_.empty() || shutdown_; });
            }
            if (shutdown_) break;
        }

        if (!events_.empty()) {
            TranscriptEvent event = std::move(events_.front());
            events_.pop_front();
            handling_ = true;
            lock.unlock();
            handle(event);
            lock.lock();
            handling_ = false;
            idle_cv_.notify_all();
            continue;
        }

        if (silence_deadline_ && std::chrono::steady_clock::now() >= *silence_deadline_) {
            silence_deadline_.reset();
            handling_ = true;
            lock.unlock();
            complete_utterance("silence timeout");
            lock.lock();
            handling_ = false;
            idle_cv_.notify_all();
        }
    }
    idle_cv_.notify_all();
}

void SpeechSession::handle(const TranscriptEvent& event) {
    using Kind = TranscriptEvent::Kind;

    if (event.kind == Kind::Closed) {
        bool was_live = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            was_live = state_ == SpeechState::Listening;
            if (was_live) state_ = SpeechState::Closed;
            silence_deadline_.reset();
        }
        if (was_live) {
            log_info("Speech", "Channel closed");
            release();
            status("Tap to start");
        }
        return;
    }
    if (event.kind == Kind::Error) {
        log_error("Speech", "Channel error: " + event.text);
        status("Connection error");
        return;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != SpeechState::Listening || muted_) return;
    }
    if (coordinator_.in_echo_cooldown()) return;

    if (event.kind == Kind::UtteranceEnd) {
        complete_utterance("utterance end");
        return;
    }
    if (trim(event.text).empty()) return;

    // New speech while the assistant talks or is about to: barge-in.
    if (coordinator_.assistant_active()) {
        log_info("Speech", "Barge-in: " + preview(event.text));
        coordinator_.interrupt();
        std::lock_guard<std::mutex> lock(mutex_);
        buffer_.clear();
    }

    std::string text;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (event.kind == Kind::Final) {
            buffer_.push_back(event.text);
            text = join(buffer_, " ");
        } else {
            text = join(buffer_, " ");
            if (!text.empty()) text += " ";
            text += event.text;
        }
        current_input_ = text;
    }
    publish_preview(text);
    arm_silence_timer();
}

void SpeechSession::arm_silence_timer() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        silence_deadline_ = std::chrono::steady_clock::now() + cfg_.silence_timeout;
    }
    cv_.notify_one();
}

void SpeechSession::complete_utterance(const char* reason) {
    std::string text;
    UtteranceHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        silence_deadline_.reset();
        // Utterance end and the silence fallback can both fire; the second
        // finds the buffer already flushed.
        if (buffer_.empty()) return;
        text = trim(join(buffer_, " "));
        buffer_.clear();
        current_input_.clear();
        handler = utterance_handler_;
    }
    publish_preview({});
    if (text.empty()) return;

    log_info("Speech", std::string("Utterance (") + reason + "): " + preview(text));
    if (handler) handler(text);
}

void SpeechSession::publish_preview(const std::string& text) {
    TextListener listener;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        listener = preview_listener_;
    }
    if (listener) listener(text);
}

void SpeechSession::status(const std::string& text) {
    TextListener listener;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        listener = status_listener_;
    }
    if (listener) listener(text);
}
