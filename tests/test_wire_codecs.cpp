// JSON shapes exchanged with the chat, synthesis and transcription services,
// and configuration from the environment.

#include <atomic>
#include <cstdlib>
#include <thread>

#include <nlohmann/json.hpp>

#include "config.hpp"
#include "deepgram_channel.hpp"
#include "elevenlabs_synthesis.hpp"
#include "errors.hpp"
#include "http_chat_backend.hpp"
#include "http_client.hpp"
#include "test_support.hpp"

namespace {

using json = nlohmann::json;

TestResult test_chat_request_body() {
    TestResult result;
    result.name = "Wire - Chat Request Body";

    ChatRequest req;
    req.messages = {{Role::User, "I like chess"}, {Role::Assistant, "Nice. Why chess?"}};
    req.phase = Phase::Profiling;
    req.onboarding_result = OnboardingResult{"chess", "tournaments", "Wants to compete"};

    json body = json::parse(encode_chat_request(req));
    if (body["phase"] != "profiling" || body["messages"].size() != 2) {
        result.details = "phase or messages wrong: " + body.dump();
        return result;
    }
    if (body["messages"][1]["role"] != "assistant" || body["messages"][0]["content"] != "I like chess") {
        result.details = "message encoding wrong";
        return result;
    }
    if (body["onboardingResult"]["subject"] != "chess") {
        result.details = "onboarding result missing";
        return result;
    }

    req.onboarding_result.reset();
    body = json::parse(encode_chat_request(req));
    if (!body.contains("onboardingResult") || !body["onboardingResult"].is_null()) {
        result.details = "absent onboarding result should be null";
        return result;
    }
    result.passed = true;
    return result;
}

TestResult test_chat_events() {
    TestResult result;
    result.name = "Wire - Structured Chat Events";

    auto t = decode_chat_event(R"({"type":"phase_transition","newPhase":"profiling",
        "onboardingResult":{"subject":"piano","reason":"relax","summary":"s"},
        "continueConversation":true})");
    if (t.kind != ChatReply::Kind::PhaseTransition || t.new_phase != Phase::Profiling ||
        !t.continue_conversation || !t.onboarding_result || t.onboarding_result->subject != "piano") {
        result.details = "phase transition decoded wrong";
        return result;
    }

    auto c = decode_chat_event(R"({"type":"complete","text":"All set!",
        "learnerProfile":{"subject":"piano","starting_level":"beginner",
        "focus_areas":["scales","chords"],"skip_areas":[]}})");
    if (c.kind != ChatReply::Kind::Complete || c.text != "All set!" || !c.learner_profile ||
        c.learner_profile->focus_areas.size() != 2 || c.learner_profile->starting_level != "beginner") {
        result.details = "complete event decoded wrong";
        return result;
    }

    const char* bad[] = {R"({"type":"mystery"})", "not json", R"({"type":"phase_transition","newPhase":"nowhere"})"};
    for (const char* body : bad) {
        bool threw = false;
        try {
            decode_chat_event(body);
        } catch (const BackendError&) {
            threw = true;
        }
        if (!threw) {
            result.details = std::string("accepted ") + body;
            return result;
        }
    }
    result.passed = true;
    return result;
}

TestResult test_profile_encoding() {
    TestResult result;
    result.name = "Wire - Learner Profile JSON Uses Backend Field Names";

    LearnerProfile p;
    p.subject = "spanish";
    p.depth = "conversational";
    p.focus_areas = {"listening"};
    json j = json::parse(encode_learner_profile(p));
    if (j["subject"] != "spanish" || j["depth"] != "conversational" || j["focus_areas"][0] != "listening") {
        result.details = j.dump();
        return result;
    }

    auto back = decode_chat_event(json{{"type", "complete"}, {"text", ""}, {"learnerProfile", j}}.dump());
    if (!back.learner_profile || back.learner_profile->depth != "conversational") {
        result.details = "profile not readable by the event decoder";
        return result;
    }
    result.passed = true;
    return result;
}

TestResult test_synthesis_body() {
    TestResult result;
    result.name = "Wire - Synthesis Request Body";

    SynthesisConfig cfg;
    json body = json::parse(encode_synthesis_request(cfg, "Hello [laughs] there."));
    if (body["text"] != "Hello [laughs] there." || body["model_id"] != "eleven_v3") {
        result.details = body.dump();
        return result;
    }
    if (body["voice_settings"]["stability"].get<double>() != 0.5 ||
        body["voice_settings"]["similarity_boost"].get<double>() != 0.75) {
        result.details = "voice settings wrong";
        return result;
    }
    result.passed = true;
    return result;
}

TestResult test_transcript_messages() {
    TestResult result;
    result.name = "Wire - Transcription Service Messages";

    auto interim = decode_deepgram_message(
        R"({"type":"Results","is_final":false,"channel":{"alternatives":[{"transcript":"hello wor"}]}})");
    auto final_ = decode_deepgram_message(
        R"({"type":"Results","is_final":true,"channel":{"alternatives":[{"transcript":"hello world"}]}})");
    auto end = decode_deepgram_message(R"({"type":"UtteranceEnd","last_word_end":2.1})");
    auto empty = decode_deepgram_message(
        R"({"type":"Results","is_final":true,"channel":{"alternatives":[{"transcript":""}]}})");
    auto meta = decode_deepgram_message(R"({"type":"Metadata","request_id":"abc"})");
    auto garbage = decode_deepgram_message("{{{");

    if (!interim || interim->kind != TranscriptEvent::Kind::Interim || interim->text != "hello wor") {
        result.details = "interim result wrong";
        return result;
    }
    if (!final_ || final_->kind != TranscriptEvent::Kind::Final || final_->text != "hello world") {
        result.details = "final result wrong";
        return result;
    }
    if (!end || end->kind != TranscriptEvent::Kind::UtteranceEnd) {
        result.details = "utterance end not recognised";
        return result;
    }
    if (empty || meta || garbage) {
        result.details = "non-transcript message produced an event";
        return result;
    }
    result.passed = true;
    return result;
}

TestResult test_config_from_env() {
    TestResult result;
    result.name = "Config - Environment Overrides Defaults";

    ::setenv("PARLEY_CHAT_URL", "http://tutor.local/api/chat", 1);
    ::setenv("ELEVENLABS_API_KEY", "xi-test", 1);
    ::setenv("PARLEY_VOICE_ID", "voice123", 1);
    ::setenv("PARLEY_TRANSCRIBER", "vosk", 1);
    ::setenv("PARLEY_CAPTURE_DEVICE", "hw:1,0", 1);
    ::unsetenv("PARLEY_TTS_MODEL");

    AppConfig cfg = AppConfig::from_env();
    if (cfg.chat_url != "http://tutor.local/api/chat" || cfg.synthesis.api_key != "xi-test" ||
        cfg.synthesis.voice_id != "voice123" || cfg.capture.device != "hw:1,0") {
        result.details = "overrides not applied";
        return result;
    }
    if (cfg.transcriber != TranscriberKind::Vosk || cfg.synthesis.model_id != "eleven_v3") {
        result.details = "transcriber or default model wrong";
        return result;
    }

    ::setenv("PARLEY_TRANSCRIBER", "carrier-pigeon", 1);
    bool threw = false;
    try {
        AppConfig::from_env();
    } catch (const std::runtime_error&) {
        threw = true;
    }
    ::unsetenv("PARLEY_TRANSCRIBER");
    if (!threw) {
        result.details = "unknown transcriber accepted";
        return result;
    }
    result.passed = true;
    return result;
}

TestResult test_concurrent_failed_requests() {
    TestResult result;
    result.name = "HTTP - Concurrent Timed Requests Fail Cleanly Per Thread";

    // Chat, synthesis and token fetches run on separate workers at once.
    const std::string url = "http://parley-unreachable.invalid/api/chat";
    std::atomic<int> backend_errors{0};
    std::atomic<int> other{0};

    std::vector<std::thread> workers;
    for (int i = 0; i < 6; ++i) {
        workers.emplace_back([&, i] {
            HttpClient http;
            try {
                if (i % 2 == 0) {
                    TurnToken token(static_cast<std::uint64_t>(i + 1));
                    http.post(url, {"Content-Type: application/json"}, "{}", &token,
                              [](const char*, std::size_t, const HttpResponse&) { return true; });
                } else {
                    http.get(url, {});
                }
                other.fetch_add(1);
            } catch (const BackendError&) {
                backend_errors.fetch_add(1);
            } catch (const std::exception&) {
                other.fetch_add(1);
            }
        });
    }
    for (auto& w : workers) w.join();

    if (backend_errors.load() != 6 || other.load() != 0) {
        result.details = std::to_string(backend_errors.load()) + " of 6 requests raised BackendError";
        return result;
    }
    result.passed = true;
    return result;
}

} // namespace

int main() {
    HttpClient::global_init();
    std::vector<TestResult> results;
    results.push_back(test_chat_request_body());
    results.push_back(test_chat_events());
    results.push_back(test_profile_encoding());
    results.push_back(test_synthesis_body());
    results.push_back(test_transcript_messages());
    results.push_back(test_config_from_env());
    results.push_back(test_concurrent_failed_requests());
    HttpClient::global_cleanup();
    return report("WIRE CODECS", results);
}
