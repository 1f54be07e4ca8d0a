#pragma once

#include <string>

#include "chat_dispatcher.hpp"

// Request body: {"messages": [...], "phase": "...", "onboardingResult": {...}}.
std::string encode_chat_request(const ChatRequest& request);

// Structured reply: {"type": "phase_transition", ...} or {"type": "complete", ...}.
// Throws BackendError for anything else.
ChatReply decode_chat_event(const std::string& body);

// Same field names the backend uses in its complete event.
std::string encode_learner_profile(const LearnerProfile& profile);

// Chat backend over HTTP: a text/plain body is a streamed reply, an
// application/json body is a structured event.
class HttpChatBackend : public ChatBackend {
public:
    explicit HttpChatBackend(std::string url);

    ChatReply send(const ChatRequest& request, const TurnToken& token, const TextSink& on_text) override;

private:
    std::string url_;
};
