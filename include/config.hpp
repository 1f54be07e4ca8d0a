#pragma once

#include <string>

#include "audio_capture.hpp"
#include "audio_playback.hpp"
#include "conversation.hpp"
#include "deepgram_channel.hpp"
#include "elevenlabs_synthesis.hpp"
#include "vosk_channel.hpp"

enum class TranscriberKind { Deepgram, Vosk };

struct AppConfig {
    std::string chat_url = "http://localhost:3000/api/chat";
    std::string profile_path; // learner profile JSON written here on completion

    TranscriberKind transcriber = TranscriberKind::Deepgram;
    DeepgramConfig deepgram;
    VoskConfig vosk;
    SynthesisConfig synthesis;

    AudioConfig capture;
    PlaybackDeviceConfig playback_device;
    ConversationConfig conversation;

    // Defaults overridden by PARLEY_* and vendor key variables.
    static AppConfig from_env();
};

// Throws std::runtime_error on unknown names.
TranscriberKind parse_transcriber(const std::string& name);
