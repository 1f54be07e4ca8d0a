#pragma once

#include <memory>
#include <string>

#include "transcription_channel.hpp"
#include "voice_activity.hpp"

struct VoskConfig {
    std::string model_path = "models/vosk-model-small-en-us-0.15";
    int sample_rate = 16000;
    VadConfig vad;
};

// Offline transcription with a local Vosk model. Utterance boundaries come
// from the energy gate, so this channel emits UtteranceEnd itself.
class VoskChannel : public TranscriptionChannel {
public:
    explicit VoskChannel(VoskConfig cfg);
    ~VoskChannel() override;

    VoskChannel(const VoskChannel&) = delete;
    VoskChannel& operator=(const VoskChannel&) = delete;

    void open(TranscriptHandler handler) override;
    void send_audio(const int16_t* samples, std::size_t count) override;
    void close() override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};
