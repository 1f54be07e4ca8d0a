#pragma once

#include <string>

#include "tts_stream.hpp"

struct SynthesisConfig {
    std::string base_url = "https://api.elevenlabs.io";
    std::string api_key;
    std::string voice_id;
    std::string model_id = "eleven_v3"; // supports inline voice tags such as [laughs]
    double stability = 0.5;
    double similarity_boost = 0.75;
    std::string output_format = "pcm_24000";
};

std::string encode_synthesis_request(const SynthesisConfig& cfg, const std::string& text);

// Streaming text-to-speech over HTTP; the response body is raw PCM.
class ElevenLabsSynthesis : public SynthesisBackend {
public:
    explicit ElevenLabsSynthesis(SynthesisConfig cfg);

    void synthesize(const std::string& text, const TurnToken& token, const ByteSink& on_bytes) override;

private:
    SynthesisConfig cfg_;
};
