#include "config.hpp"

#include <cstdlib>
#include <stdexcept>

namespace {

void override_from(const char* name, std::string& field) {
    const char* value = std::getenv(name);
    if (value && *value) field = value;
}

} // namespace

TranscriberKind parse_transcriber(const std::string& name) {
    if (name == "deepgram") return TranscriberKind::Deepgram;
    if (name == "vosk") return TranscriberKind::Vosk;
    throw std::runtime_error("Unknown transcriber '" + name + "' (expected deepgram or vosk)");
}

AppConfig AppConfig::from_env() {
    AppConfig cfg;

    override_from("PARLEY_CHAT_URL", cfg.chat_url);
    override_from("PARLEY_PROFILE_PATH", cfg.profile_path);

    override_from("PARLEY_TOKEN_URL", cfg.deepgram.token_url);
    override_from("DEEPGRAM_API_KEY", cfg.deepgram.api_key);

    override_from("ELEVENLABS_API_KEY", cfg.synthesis.api_key);
    override_from("PARLEY_VOICE_ID", cfg.synthesis.voice_id);
    override_from("PARLEY_TTS_MODEL", cfg.synthesis.model_id);

    std::string transcriber;
    override_from("PARLEY_TRANSCRIBER", transcriber);
    if (!transcriber.empty()) cfg.transcriber = parse_transcriber(transcriber);
    override_from("PARLEY_VOSK_MODEL", cfg.vosk.model_path);

    override_from("PARLEY_CAPTURE_DEVICE", cfg.capture.device);
    override_from("PARLEY_PLAYBACK_DEVICE", cfg.playback_device.device);

    // Capture and transcription share one format; playback follows the synthesis output.
    cfg.vosk.sample_rate = static_cast<int>(cfg.capture.sample_rate);
    cfg.conversation.playback.sample_rate = static_cast<int>(cfg.playback_device.sample_rate);
    return cfg;
}
