#include "elevenlabs_synthesis.hpp"

#include <nlohmann/json.hpp>

#include "errors.hpp"
#include "http_client.hpp"
#include "utils.hpp"

std::string encode_synthesis_request(const SynthesisConfig& cfg, const std::string& text) {
    nlohmann::json body = {
        {"text", text},
        {"model_id", cfg.model_id},
        {"voice_settings", {{"stability", cfg.stability}, {"similarity_boost", cfg.similarity_boost}}},
    };
    return body.dump();
}

ElevenLabsSynthesis::ElevenLabsSynthesis(SynthesisConfig cfg) : cfg_(std::move(cfg)) {}

void ElevenLabsSynthesis::synthesize(const std::string& text, const TurnToken& token, const ByteSink& on_bytes) {
    const std::string url = cfg_.base_url + "/v1/text-to-speech/" + cfg_.voice_id +
                            "/stream?output_format=" + cfg_.output_format;
    const std::vector<std::string> headers = {
        "Content-Type: application/json",
        "xi-api-key: " + cfg_.api_key,
    };

    HttpClient http;
    HttpResponse res = http.post(url, headers, encode_synthesis_request(cfg_, text), &token,
        [&](const char* data, std::size_t len, const HttpResponse&) {
            return on_bytes(data, len);
        });

    if (!res.ok()) {
        log_error("TTS", "HTTP error: " + std::to_string(res.status) + " " + preview(res.body));
        throw BackendError("Synthesis failed: " + std::to_string(res.status), res.status);
    }
}
