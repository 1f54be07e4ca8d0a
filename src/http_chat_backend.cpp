#include "http_chat_backend.hpp"

#include <nlohmann/json.hpp>

#include "errors.hpp"
#include "http_client.hpp"
#include "utils.hpp"

using json = nlohmann::json;

namespace {

std::string string_field(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return {};
    if (it->is_string()) return it->get<std::string>();
    return it->dump();
}

std::vector<std::string> list_field(const json& j, const char* key) {
    std::vector<std::string> out;
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return out;
    if (it->is_array()) {
        for (const auto& item : *it) {
            out.push_back(item.is_string() ? item.get<std::string>() : item.dump());
        }
    } else if (it->is_string()) {
        out.push_back(it->get<std::string>());
    }
    return out;
}

OnboardingResult parse_onboarding(const json& j) {
    return {string_field(j, "subject"), string_field(j, "reason"), string_field(j, "summary")};
}

LearnerProfile parse_profile(const json& j) {
    LearnerProfile p;
    p.subject = string_field(j, "subject");
    p.reason = string_field(j, "reason");
    p.summary = string_field(j, "summary");
    p.starting_level = string_field(j, "starting_level");
    p.depth = string_field(j, "depth");
    p.focus_areas = list_field(j, "focus_areas");
    p.skip_areas = list_field(j, "skip_areas");
    p.learner_context = string_field(j, "learner_context");
    p.notes = string_field(j, "notes");
    return p;
}

} // namespace

std::string encode_learner_profile(const LearnerProfile& profile) {
    json j = {
        {"subject", profile.subject},
        {"reason", profile.reason},
        {"summary", profile.summary},
        {"starting_level", profile.starting_level},
        {"depth", profile.depth},
        {"focus_areas", profile.focus_areas},
        {"skip_areas", profile.skip_areas},
        {"learner_context", profile.learner_context},
        {"notes", profile.notes},
    };
    return j.dump(2);
}

std::string encode_chat_request(const ChatRequest& request) {
    json messages = json::array();
    for (const auto& m : request.messages) {
        messages.push_back({{"role", role_name(m.role)}, {"content", m.content}});
    }

    json body = {
        {"messages", messages},
        {"phase", phase_name(request.phase)},
    };
    if (request.onboarding_result) {
        const auto& r = *request.onboarding_result;
        body["onboardingResult"] = {{"subject", r.subject}, {"reason", r.reason}, {"summary", r.summary}};
    } else {
        body["onboardingResult"] = nullptr;
    }
    return body.dump();
}

ChatReply decode_chat_event(const std::string& body) {
    json j = json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        throw BackendError("Malformed chat event: " + preview(body));
    }

    const std::string type = string_field(j, "type");
    ChatReply reply;
    if (type == "phase_transition") {
        auto phase = parse_phase(string_field(j, "newPhase"));
        if (!phase) {
            throw BackendError("Unknown phase in transition: " + string_field(j, "newPhase"));
        }
        reply.kind = ChatReply::Kind::PhaseTransition;
        reply.new_phase = *phase;
        auto result = j.find("onboardingResult");
        if (result == j.end()) result = j.find("result");
        if (result != j.end() && result->is_object()) {
            reply.onboarding_result = parse_onboarding(*result);
        }
        reply.continue_conversation = j.value("continueConversation", false);
        return reply;
    }
    if (type == "complete") {
        reply.kind = ChatReply::Kind::Complete;
        reply.text = string_field(j, "text");
        auto profile = j.find("learnerProfile");
        if (profile != j.end() && profile->is_object()) {
            reply.learner_profile = parse_profile(*profile);
        }
        return reply;
    }
    throw BackendError("Unknown chat event type: " + (type.empty() ? std::string("(none)") : type));
}

HttpChatBackend::HttpChatBackend(std::string url) : url_(std::move(url)) {}

ChatReply HttpChatBackend::send(const ChatRequest& request, const TurnToken& token, const TextSink& on_text) {
    HttpClient http;
    const std::vector<std::string> headers = {"Content-Type: application/json"};

    bool streamed = false;
    bool structured = false;
    std::string event_body;

    HttpResponse res = http.post(url_, headers, encode_chat_request(request), &token,
        [&](const char* data, std::size_t len, const HttpResponse& head) {
            if (head.content_type.find("application/json") != std::string::npos) {
                structured = true;
                event_body.append(data, len);
                return true;
            }
            if (head.content_type.find("text/plain") != std::string::npos) {
                streamed = true;
                return on_text(std::string(data, len));
            }
            return false;
        });

    log_info("Chat", "Response status: " + std::to_string(res.status));
    if (!res.ok()) {
        throw BackendError("Chat failed: " + std::to_string(res.status) + " " + preview(res.body), res.status);
    }
    if (structured) {
        return decode_chat_event(event_body);
    }
    if (streamed || res.content_type.find("text/plain") != std::string::npos) {
        return ChatReply{};
    }
    throw BackendError("Unexpected chat response type: " +
                       (res.content_type.empty() ? std::string("(none)") : res.content_type));
}
