#include "audio_playback.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <thread>

#if defined(__linux__)

#include <alsa/asoundlib.h>
#include <sstream>

namespace {

std::string alsa_error(int code, const std::string& context) {
    std::ostringstream oss;
    oss << context << ": " << snd_strerror(code);
    return oss.str();
}

int16_t to_pcm16(float x) {
    x = std::max(-1.0f, std::min(1.0f, x));
    return static_cast<int16_t>(x * 32767.0f);
}

} // namespace

struct AudioPlayback::Impl {
    explicit Impl(const PlaybackDeviceConfig& cfg) : cfg_(cfg) {}
    ~Impl() { close(); }

    void open();
    void close();
    double now() const;
    void play(const std::vector<float>& samples, int sample_rate, double start_at, const std::atomic<bool>& halt);
    void drain(const std::atomic<bool>& wake);
    void halt();

private:
    double queued_seconds();
    void cut();
    bool write_frames(const int16_t* data, std::size_t frames, const std::atomic<bool>& halt);

    PlaybackDeviceConfig cfg_;
    snd_pcm_t* handle_{nullptr};
    // play() runs on the scheduler thread, halt() on whoever stops playback.
    std::mutex device_mutex_;
    std::chrono::steady_clock::time_point epoch_{std::chrono::steady_clock::now()};
};

void AudioPlayback::Impl::open() {
    if (handle_) {
        throw std::runtime_error("Playback device already open");
    }

    int err = snd_pcm_open(&handle_, cfg_.device.c_str(), SND_PCM_STREAM_PLAYBACK, 0);
    if (err < 0) {
        handle_ = nullptr;
        throw std::runtime_error(alsa_error(err, "snd_pcm_open"));
    }

    snd_pcm_hw_params_t* hw_params = nullptr;
    snd_pcm_hw_params_alloca(&hw_params);

    auto check = [&](int code, const char* context) {
        if (code < 0) {
            snd_pcm_close(handle_);
            handle_ = nullptr;
            throw std::runtime_error(alsa_error(code, context));
        }
    };

    check(snd_pcm_hw_params_any(handle_, hw_params), "snd_pcm_hw_params_any");
    check(snd_pcm_hw_params_set_access(handle_, hw_params, SND_PCM_ACCESS_RW_INTERLEAVED),
          "snd_pcm_hw_params_set_access");
    check(snd_pcm_hw_params_set_format(handle_, hw_params, SND_PCM_FORMAT_S16_LE),
          "snd_pcm_hw_params_set_format");
    check(snd_pcm_hw_params_set_channels(handle_, hw_params, cfg_.channels),
          "snd_pcm_hw_params_set_channels");

    unsigned int rate = cfg_.sample_rate;
    check(snd_pcm_hw_params_set_rate_near(handle_, hw_params, &rate, nullptr),
          "snd_pcm_hw_params_set_rate_near");
    if (rate != cfg_.sample_rate) {
        std::cout << "Warning: playback rate adjusted to " << rate << " Hz\n";
        cfg_.sample_rate = rate;
    }

    snd_pcm_uframes_t period = cfg_.period_frames;
    check(snd_pcm_hw_params_set_period_size_near(handle_, hw_params, &period, nullptr),
          "snd_pcm_hw_params_set_period_size_near");
    cfg_.period_frames = static_cast<unsigned>(period);

    snd_pcm_uframes_t buffer = period * cfg_.buffer_periods;
    check(snd_pcm_hw_params_set_buffer_size_near(handle_, hw_params, &buffer),
          "snd_pcm_hw_params_set_buffer_size_near");

    check(snd_pcm_hw_params(handle_, hw_params), "snd_pcm_hw_params");
    check(snd_pcm_prepare(handle_), "snd_pcm_prepare");

    epoch_ = std::chrono::steady_clock::now();
}

void AudioPlayback::Impl::close() {
    std::lock_guard<std::mutex> lock(device_mutex_);
    if (handle_) {
        snd_pcm_drop(handle_);
        snd_pcm_close(handle_);
        handle_ = nullptr;
    }
}

double AudioPlayback::Impl::now() const {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - epoch_).count();
}

double AudioPlayback::Impl::queued_seconds() {
    std::lock_guard<std::mutex> lock(device_mutex_);
    if (!handle_) return 0.0;
    snd_pcm_sframes_t delay = 0;
    if (snd_pcm_delay(handle_, &delay) < 0 || delay < 0) return 0.0;
    return static_cast<double>(delay) / cfg_.sample_rate;
}

void AudioPlayback::Impl::cut() {
    std::lock_guard<std::mutex> lock(device_mutex_);
    if (!handle_) return;
    snd_pcm_drop(handle_);
    snd_pcm_prepare(handle_);
}

void AudioPlayback::Impl::halt() {
    cut();
}

void AudioPlayback::Impl::drain(const std::atomic<bool>& wake) {
    while (!wake && queued_seconds() > 0.0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
}

bool AudioPlayback::Impl::write_frames(const int16_t* data, std::size_t frames, const std::atomic<bool>& halt) {
    std::size_t offset = 0;
    while (offset < frames) {
        if (halt) {
            cut();
            return false;
        }
        std::size_t n = std::min<std::size_t>(cfg_.period_frames, frames - offset);
        snd_pcm_sframes_t written = 0;
        {
            std::lock_guard<std::mutex> lock(device_mutex_);
            if (!handle_) throw std::runtime_error("Playback device not open");
            written = snd_pcm_writei(handle_, data + offset * cfg_.channels, n);
            if (written < 0) {
                written = snd_pcm_recover(handle_, static_cast<int>(written), 1);
                if (written < 0) {
                    throw std::runtime_error(alsa_error(static_cast<int>(written), "snd_pcm_writei"));
                }
                continue;
            }
        }
        offset += static_cast<std::size_t>(written);
    }
    return true;
}

void AudioPlayback::Impl::play(const std::vector<float>& samples,
                               int sample_rate,
                               double start_at,
                               const std::atomic<bool>& halt) {
    if (!handle_) {
        throw std::runtime_error("Playback device not open");
    }
    if (static_cast<unsigned>(sample_rate) != cfg_.sample_rate) {
        throw std::runtime_error("Chunk rate " + std::to_string(sample_rate) + " Hz does not match device");
    }

    // Silence up to start_at if the scheduled start lies beyond what is already queued.
    const double starts_at = now() + queued_seconds();
    if (start_at > starts_at) {
        std::vector<int16_t> silence(static_cast<std::size_t>((start_at - starts_at) * cfg_.sample_rate) * cfg_.channels, 0);
        if (!write_frames(silence.data(), silence.size() / cfg_.channels, halt)) return;
    }

    std::vector<int16_t> pcm(samples.size() * cfg_.channels);
    for (std::size_t i = 0; i < samples.size(); ++i) {
        for (unsigned c = 0; c < cfg_.channels; ++c) {
            pcm[i * cfg_.channels + c] = to_pcm16(samples[i]);
        }
    }
    if (!write_frames(pcm.data(), samples.size(), halt)) return;

    // Hand back control while lead_ms of audio is still queued so the next
    // chunk lands before the device runs dry.
    const double lead = cfg_.lead_ms / 1000.0;
    while (queued_seconds() > lead) {
        if (halt) {
            cut();
            return;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
}

#else

struct AudioPlayback::Impl {
    explicit Impl(const PlaybackDeviceConfig&) {
        throw std::runtime_error("Audio playback not supported on this platform");
    }
    void open() {}
    void close() {}
    double now() const { return 0.0; }
    void play(const std::vector<float>&, int, double, const std::atomic<bool>&) {}
    void drain(const std::atomic<bool>&) {}
    void halt() {}
};

#endif

AudioPlayback::AudioPlayback(const PlaybackDeviceConfig& cfg) : impl_(new Impl(cfg)) {}

AudioPlayback::~AudioPlayback() { delete impl_; }

void AudioPlayback::open() { impl_->open(); }

void AudioPlayback::close() { impl_->close(); }

double AudioPlayback::now() const { return impl_->now(); }

void AudioPlayback::play(const std::vector<float>& samples,
                         int sample_rate,
                         double start_at,
                         const std::atomic<bool>& halt) {
    impl_->play(samples, sample_rate, start_at, halt);
}

void AudioPlayback::drain(const std::atomic<bool>& wake) { impl_->drain(wake); }

void AudioPlayback::halt() { impl_->halt(); }
