#pragma once

#include <atomic>
#include <string>
#include <vector>

#include "audio_sink.hpp"

struct PlaybackDeviceConfig {
    unsigned sample_rate = 24000;      // synthesis output rate
    unsigned channels = 1;
    unsigned period_frames = 480;      // 20 ms per write at 24 kHz
    unsigned buffer_periods = 10;      // device ring of ~200 ms
    unsigned lead_ms = 60;             // return from play() with this much audio still queued
    std::string device = "default";    // ALSA device name or default output
};

// ALSA output device. The output clock counts seconds since open().
class AudioPlayback : public AudioSink {
public:
    explicit AudioPlayback(const PlaybackDeviceConfig& cfg);
    ~AudioPlayback() override;

    AudioPlayback(const AudioPlayback&) = delete;
    AudioPlayback& operator=(const AudioPlayback&) = delete;

    // Throws if the device is already open or cannot be configured.
    void open();
    // Releasing twice is a no-op.
    void close();

    double now() const override;
    void play(const std::vector<float>& samples,
              int sample_rate,
              double start_at,
              const std::atomic<bool>& halt) override;
    void drain(const std::atomic<bool>& wake) override;
    void halt() override;

private:
    struct Impl;
    Impl* impl_;
};
