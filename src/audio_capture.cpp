#include "audio_capture.hpp"

#include <atomic>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#if defined(__linux__)

#include <alsa/asoundlib.h>
#include <algorithm>
#include <cstdio>
#include <sstream>

namespace {

std::string alsa_error(int code, const std::string& context) {
    std::ostringstream oss;
    oss << context << ": " << snd_strerror(code);
    return oss.str();
}

} // namespace

struct AudioCapture::Impl {
    explicit Impl(const AudioConfig& cfg);
    ~Impl();

    void start();
    std::size_t read(std::vector<int16_t>& out);
    void stop();
    void set_enabled(bool enabled) { enabled_ = enabled; }
    static void list_devices();

private:
    AudioConfig cfg_;
    snd_pcm_t* handle_{nullptr};
    bool started_{false};
    std::atomic<bool> enabled_{true};
};

AudioCapture::Impl::Impl(const AudioConfig& cfg) : cfg_(cfg) {}

AudioCapture::Impl::~Impl() {
    stop();
}

void AudioCapture::Impl::start() {
    if (started_) {
        throw std::runtime_error("Capture device already open");
    }

    int err = snd_pcm_open(&handle_, cfg_.device.c_str(), SND_PCM_STREAM_CAPTURE, 0);
    if (err < 0) {
        handle_ = nullptr;
        throw std::runtime_error(alsa_error(err, "snd_pcm_open"));
    }

    snd_pcm_hw_params_t* hw_params = nullptr;
    snd_pcm_hw_params_malloc(&hw_params);
    if (!hw_params) {
        stop();
        throw std::runtime_error("Failed to allocate ALSA hw params");
    }

    auto fail = [&](int code, const char* context) {
        snd_pcm_hw_params_free(hw_params);
        snd_pcm_close(handle_);
        handle_ = nullptr;
        throw std::runtime_error(alsa_error(code, context));
    };

    snd_pcm_hw_params_any(handle_, hw_params);

    err = snd_pcm_hw_params_set_access(handle_, hw_params, SND_PCM_ACCESS_RW_INTERLEAVED);
    if (err < 0) fail(err, "snd_pcm_hw_params_set_access");

    err = snd_pcm_hw_params_set_format(handle_, hw_params, SND_PCM_FORMAT_S16_LE);
    if (err < 0) fail(err, "snd_pcm_hw_params_set_format");

    err = snd_pcm_hw_params_set_channels(handle_, hw_params, cfg_.channels);
    if (err < 0) fail(err, "snd_pcm_hw_params_set_channels");

    unsigned int rate = cfg_.sample_rate;
    err = snd_pcm_hw_params_set_rate_near(handle_, hw_params, &rate, nullptr);
    if (err < 0) fail(err, "snd_pcm_hw_params_set_rate_near");
    if (rate != cfg_.sample_rate) {
        std::cout << "Warning: capture rate adjusted to " << rate << " Hz\n";
        cfg_.sample_rate = rate;
    }

    snd_pcm_uframes_t frames = cfg_.frames_per_buffer;
    err = snd_pcm_hw_params_set_period_size_near(handle_, hw_params, &frames, nullptr);
    if (err < 0) fail(err, "snd_pcm_hw_params_set_period_size_near");
    cfg_.frames_per_buffer = static_cast<unsigned>(frames);

    err = snd_pcm_hw_params(handle_, hw_params);
    snd_pcm_hw_params_free(hw_params);
    if (err < 0) {
        snd_pcm_close(handle_);
        handle_ = nullptr;
        throw std::runtime_error(alsa_error(err, "snd_pcm_hw_params"));
    }

    err = snd_pcm_prepare(handle_);
    if (err < 0) {
        snd_pcm_close(handle_);
        handle_ = nullptr;
        throw std::runtime_error(alsa_error(err, "snd_pcm_prepare"));
    }

    started_ = true;
}

std::size_t AudioCapture::Impl::read(std::vector<int16_t>& out) {
    if (!handle_) return 0;

    out.resize(static_cast<std::size_t>(cfg_.frames_per_buffer) * cfg_.channels);
    snd_pcm_sframes_t frames = snd_pcm_readi(handle_, out.data(), cfg_.frames_per_buffer);
    if (frames < 0) {
        frames = snd_pcm_recover(handle_, static_cast<int>(frames), 1);
    }
    if (frames < 0) {
        throw std::runtime_error(alsa_error(static_cast<int>(frames), "snd_pcm_readi"));
    }
    if (frames == 0) {
        out.clear();
        return 0;
    }

    std::size_t samples = static_cast<std::size_t>(frames) * cfg_.channels;
    out.resize(samples);
    if (!enabled_) {
        std::fill(out.begin(), out.end(), 0);
    }
    return samples;
}

void AudioCapture::Impl::stop() {
    if (handle_) {
        snd_pcm_drop(handle_);
        snd_pcm_close(handle_);
        handle_ = nullptr;
    }
    started_ = false;
}

void AudioCapture::Impl::list_devices() {
    int card = -1;
    if (snd_card_next(&card) < 0 || card < 0) {
        std::cout << "No ALSA capture devices found.\n";
        return;
    }

    std::cout << "ALSA capture devices (use \"plughw:x,y\"):\n";
    while (card >= 0) {
        snd_ctl_t* ctl = nullptr;
        char card_name[32];
        std::snprintf(card_name, sizeof(card_name), "hw:%d", card);
        if (snd_ctl_open(&ctl, card_name, 0) < 0) {
            snd_card_next(&card);
            continue;
        }

        snd_pcm_info_t* pcm_info = nullptr;
        snd_pcm_info_malloc(&pcm_info);
        if (!pcm_info) {
            std::cout << "  (Failed to allocate pcm_info)\n";
            snd_ctl_close(ctl);
            snd_card_next(&card);
            continue;
        }

        int device = -1;
        while (true) {
            if (snd_ctl_pcm_next_device(ctl, &device) < 0) break;
            if (device < 0) break;

            snd_pcm_info_set_device(pcm_info, device);
            snd_pcm_info_set_subdevice(pcm_info, 0);
            snd_pcm_info_set_stream(pcm_info, SND_PCM_STREAM_CAPTURE);

            if (snd_ctl_pcm_info(ctl, pcm_info) < 0) continue;

            const char* name = snd_pcm_info_get_name(pcm_info);
            const char* id = snd_pcm_info_get_id(pcm_info);
            std::cout << "- hw:" << card << "," << device;
            if (name) std::cout << " (" << name << ")";
            if (id) std::cout << " [" << id << "]";
            std::cout << "\n";
        }

        snd_pcm_info_free(pcm_info);
        snd_ctl_close(ctl);
        snd_card_next(&card);
    }
}

#else

struct AudioCapture::Impl {
    explicit Impl(const AudioConfig&) {
        throw std::runtime_error("Audio capture not supported on this platform");
    }
    ~Impl() = default;
    void start() {}
    std::size_t read(std::vector<int16_t>&) { return 0; }
    void stop() {}
    void set_enabled(bool) {}
    static void list_devices() {
        std::cout << "Audio capture not supported on this platform.\n";
    }
};

#endif

AudioCapture::AudioCapture(const AudioConfig& cfg) : impl_(new Impl(cfg)) {}

AudioCapture::~AudioCapture() { delete impl_; }

void AudioCapture::start() { impl_->start(); }

std::size_t AudioCapture::read(std::vector<int16_t>& out) { return impl_->read(out); }

void AudioCapture::stop() { impl_->stop(); }

void AudioCapture::set_enabled(bool enabled) { impl_->set_enabled(enabled); }

void AudioCapture::list_devices() { Impl::list_devices(); }
