#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "microphone.hpp"

struct AudioConfig {
    unsigned sample_rate = 16000;          // 16 kHz linear16 for the transcription channel
    unsigned channels = 1;                 // mono by default
    unsigned frames_per_buffer = 512;      // buffer size per capture read
    std::string device = "default";        // ALSA device name or default input
};

class AudioCapture : public MicrophoneSource {
public:
    explicit AudioCapture(const AudioConfig& cfg);
    ~AudioCapture() override;

    AudioCapture(const AudioCapture&) = delete;
    AudioCapture& operator=(const AudioCapture&) = delete;

    void start() override;
    std::size_t read(std::vector<int16_t>& out) override;
    void stop() override;
    void set_enabled(bool enabled) override;

    static void list_devices();

private:
    struct Impl;
    Impl* impl_;
};
