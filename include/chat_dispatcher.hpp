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

#include "interruption.hpp"
#include "session.hpp"
#include "tts_stream.hpp"
#include "turn_token.hpp"

struct ChatRequest {
    std::vector<Message> messages;
    Phase phase{Phase::Onboarding};
    std::optional<OnboardingResult> onboarding_result;
};

// Shape of the backend's answer to one request.
struct ChatReply {
    enum class Kind { Streamed, PhaseTransition, Complete };

    Kind kind{Kind::Streamed};

    // PhaseTransition
    Phase new_phase{Phase::Profiling};
    std::optional<OnboardingResult> onboarding_result;
    bool continue_conversation{false};

    // Complete
    std::string text;
    std::optional<LearnerProfile> learner_profile;
};

// Receives streamed reply text as it arrives; returning false stops the read.
using TextSink = std::function<bool(const std::string& chunk)>;

class ChatBackend {
public:
    virtual ~ChatBackend() = default;

    // Issues one request. A streamed reply is delivered through on_text before
    // returning Kind::Streamed. Throws BackendError on non-success status or an
    // unknown reply shape, CancellationError once token fires.
    virtual ChatReply send(const ChatRequest& request, const TurnToken& token, const TextSink& on_text) = 0;
};

// Serializes conversation turns: one drain worker takes utterances in FIFO
// order and never starts a turn before the previous turn's request returned.
class ChatDispatcher {
public:
    using StatusListener = std::function<void(const std::string&)>;
    using IdleStatus = std::function<std::string()>;
    using CompletionListener = std::function<void(const std::optional<LearnerProfile>&)>;

    ChatDispatcher(ChatBackend& backend,
                   Session& session,
                   TtsStreamClient& tts,
                   InterruptionCoordinator& coordinator);
    ~ChatDispatcher();

    ChatDispatcher(const ChatDispatcher&) = delete;
    ChatDispatcher& operator=(const ChatDispatcher&) = delete;

    // No-op for blank text or once the session is complete.
    void enqueue(const std::string& utterance);

    // Discards pending utterances and cancels the turn in flight, returning
    // once that turn has settled. Idempotent.
    void stop();

    bool busy() const;
    std::size_t pending() const;

    void set_status_listener(StatusListener listener);
    // Status shown once a turn settles, e.g. "Listening...".
    void set_idle_status(IdleStatus idle_status);
    void set_completion_listener(CompletionListener listener);

private:
    void drain();
    void process_one(const std::string& content, std::uint64_t epoch);
    ChatReply request(const ChatRequest& req, const TurnTokenPtr& token);
    void status(const std::string& text);

    ChatBackend& backend_;
    Session& session_;
    TtsStreamClient& tts_;
    InterruptionCoordinator& coordinator_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::condition_variable settled_cv_;
    std::deque<std::string> queue_;
    bool sending_{false};
    std::uint64_t stop_epoch_{0};
    bool shutdown_{false};
    StatusListener status_listener_;
    IdleStatus idle_status_;
    CompletionListener completion_listener_;

    std::thread worker_;
};
