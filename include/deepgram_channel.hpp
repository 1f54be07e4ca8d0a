#pragma once

#include <chrono>
#include <optional>
#include <string>

#include "transcription_channel.hpp"

struct DeepgramConfig {
    std::string host = "api.deepgram.com";
    int port = 443;
    std::string path = "/v1/listen?model=nova-2&language=en&smart_format=true"
                       "&interim_results=true&utterance_end_ms=2000&vad_events=true"
                       "&encoding=linear16&sample_rate=16000&channels=1";
    std::string api_key;   // used directly when token_url is empty
    std::string token_url; // one-shot token endpoint returning {"token": "..."}
    std::string ca_path = "/etc/ssl/certs/ca-certificates.crt";
    std::chrono::milliseconds connect_timeout{10000};
};

// Maps one inbound JSON message to a transcript event. Messages without
// transcript text (metadata, speech-started) map to nothing.
std::optional<TranscriptEvent> decode_deepgram_message(const std::string& msg);

// Obtains the socket credential. Throws ConnectionError.
std::string fetch_transcription_token(const DeepgramConfig& cfg);

// Streaming transcription over a libwebsockets client connection. A service
// thread owns the socket; audio frames are queued and written when writable.
class DeepgramChannel : public TranscriptionChannel {
public:
    explicit DeepgramChannel(DeepgramConfig cfg);
    ~DeepgramChannel() override;

    DeepgramChannel(const DeepgramChannel&) = delete;
    DeepgramChannel& operator=(const DeepgramChannel&) = delete;

    void open(TranscriptHandler handler) override;
    void send_audio(const int16_t* samples, std::size_t count) override;
    void close() override;

private:
    struct Impl;
    Impl* impl_;
};
