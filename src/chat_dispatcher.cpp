#include "chat_dispatcher.hpp"

#include "errors.hpp"
#include "sentence_segmenter.hpp"
#include "utils.hpp"

ChatDispatcher::ChatDispatcher(ChatBackend& backend,
                               Session& session,
                               TtsStreamClient& tts,
                               InterruptionCoordinator& coordinator)
    : backend_(backend), session_(session), tts_(tts), coordinator_(coordinator) {
    worker_ = std::thread(&ChatDispatcher::drain, this);
}

ChatDispatcher::~ChatDispatcher() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        shutdown_ = true;
        queue_.clear();
    }
    cv_.notify_all();
    settled_cv_.notify_all();
    if (auto token = coordinator_.current_turn()) {
        token->cancel();
    }
    if (worker_.joinable()) {
        worker_.join();
    }
}

void ChatDispatcher::enqueue(const std::string& utterance) {
    std::string content = trim(utterance);
    if (content.empty()) return;
    if (session_.complete()) return;

    log_info("Chat", "Queued: " + preview(content));
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutdown_) return;
        queue_.push_back(std::move(content));
    }
    cv_.notify_one();
}

void ChatDispatcher::stop() {
    bool was_sending = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.clear();
        ++stop_epoch_;
        was_sending = sending_;
    }
    if (!was_sending) return;

    coordinator_.interrupt();
    // A listener running on the worker may stop us; it cannot wait for itself.
    if (std::this_thread::get_id() == worker_.get_id()) return;
    std::unique_lock<std::mutex> lock(mutex_);
    settled_cv_.wait(lock, [this] { return !sending_ || shutdown_; });
}

bool ChatDispatcher::busy() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sending_ || !queue_.empty();
}

std::size_t ChatDispatcher::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

void ChatDispatcher::set_status_listener(StatusListener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    status_listener_ = std::move(listener);
}

void ChatDispatcher::set_idle_status(IdleStatus idle_status) {
    std::lock_guard<std::mutex> lock(mutex_);
    idle_status_ = std::move(idle_status);
}

void ChatDispatcher::set_completion_listener(CompletionListener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    completion_listener_ = std::move(listener);
}

void ChatDispatcher::status(const std::string& text) {
    StatusListener listener;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        listener = status_listener_;
    }
    if (listener) listener(text);
}

void ChatDispatcher::drain() {
    while (true) {
        std::string content;
        std::uint64_t epoch = 0;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            sending_ = false;
            settled_cv_.notify_all();
            cv_.wait(lock, [this] { return !queue_.empty() || shutdown_; });
            if (shutdown_) break;

            content = std::move(queue_.front());
            queue_.pop_front();
            sending_ = true;
            epoch = stop_epoch_;
        }
        process_one(content, epoch);
    }
}

void ChatDispatcher::process_one(const std::string& content, std::uint64_t epoch) {
    if (session_.complete()) return;

    TurnTokenPtr token = coordinator_.begin_turn();
    {
        // stop() landed between taking the utterance and starting its turn.
        std::lock_guard<std::mutex> lock(mutex_);
        if (epoch != stop_epoch_) token->cancel();
    }
    if (token->cancelled()) {
        coordinator_.end_request(token);
        return;
    }
    session_.append(Role::User, content);
    status("Thinking...");
    log_info("Chat", "Turn " + std::to_string(token->id()) + ": " + preview(content));

    bool failed = false;
    try {
        ChatRequest req{session_.messages(), session_.phase(), session_.onboarding_result()};
        ChatReply reply = request(req, token);

        if (reply.kind == ChatReply::Kind::PhaseTransition) {
            session_.set_phase(reply.new_phase);
            if (reply.onboarding_result) {
                session_.set_onboarding_result(*reply.onboarding_result);
            }
            log_info("Chat", std::string("Transitioning to ") + phase_name(reply.new_phase) + " phase");

            if (reply.continue_conversation) {
                ChatRequest follow{session_.messages(), reply.new_phase, session_.onboarding_result()};
                ChatReply next = request(follow, token);
                if (next.kind != ChatReply::Kind::Streamed) {
                    log_error("Chat", "Follow-up request did not stream text, ignoring");
                }
            }
        } else if (reply.kind == ChatReply::Kind::Complete) {
            session_.set_phase(Phase::Complete);
            if (reply.learner_profile) {
                session_.set_learner_profile(*reply.learner_profile);
            }
            session_.append(Role::Assistant, reply.text);
            tts_.enqueue(reply.text, token);
            log_info("Chat", "Conversation complete");

            CompletionListener listener;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                listener = completion_listener_;
            }
            if (listener) listener(reply.learner_profile);
        }
    } catch (const CancellationError&) {
        log_info("Chat", "Turn " + std::to_string(token->id()) + " cancelled");
    } catch (const BackendError& e) {
        log_error("Chat", std::string("Error: ") + e.what());
        failed = true;
    } catch (const std::exception& e) {
        log_error("Chat", std::string("Error: ") + e.what());
        failed = true;
    }

    coordinator_.end_request(token);

    if (failed) {
        status("Error occurred");
        return;
    }
    if (session_.complete()) {
        status("Course ready");
        return;
    }
    IdleStatus idle;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        idle = idle_status_;
    }
    status(idle ? idle() : "Ready");
}

ChatReply ChatDispatcher::request(const ChatRequest& req, const TurnTokenPtr& token) {
    SentenceSegmenter segmenter;
    bool opened = false;
    std::size_t received = 0;

    ChatReply reply = backend_.send(req, *token, [&](const std::string& chunk) {
        if (token->cancelled()) return false;
        if (!opened) {
            session_.begin_assistant_message();
            opened = true;
        }
        received += chunk.size();
        session_.append_assistant_text(chunk);
        for (auto& sentence : segmenter.feed(chunk)) {
            log_info("Chat", "Queueing sentence: " + preview(sentence));
            tts_.enqueue(std::move(sentence), token);
        }
        return true;
    });
    token->throw_if_cancelled();

    if (reply.kind == ChatReply::Kind::Streamed) {
        if (!opened) {
            session_.begin_assistant_message();
        }
        if (auto rest = segmenter.finish()) {
            log_info("Chat", "Queueing remainder: " + preview(*rest));
            tts_.enqueue(std::move(*rest), token);
        }
        log_info("Chat", "Stream done, " + std::to_string(received) + " bytes");
    }
    return reply;
}
