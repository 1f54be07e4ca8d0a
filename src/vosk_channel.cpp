#include "vosk_channel.hpp"

#include <condition_variable>
#include <deque>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "errors.hpp"
#include "utils.hpp"

#if defined(PARLEY_WITH_VOSK)
#include <nlohmann/json.hpp>
#include <vosk_api.h>
#endif

namespace {

#if defined(PARLEY_WITH_VOSK)
std::string json_field(const char* raw, const char* field) {
    if (!raw) return {};
    auto j = nlohmann::json::parse(raw, nullptr, false);
    if (j.is_discarded() || !j.is_object()) return {};
    return trim(j.value(field, std::string()));
}
#endif

} // namespace

struct VoskChannel::Impl {
    explicit Impl(VoskConfig c) : cfg(std::move(c)), vad(cfg.vad) {}

    VoskConfig cfg;
    VoiceActivityDetector vad;
    TranscriptHandler handler;

    std::thread worker;
    std::mutex mutex;
    std::condition_variable cv;
    std::deque<std::vector<int16_t>> frames;
    bool running{false};

#if defined(PARLEY_WITH_VOSK)
    VoskModel* model{nullptr};
    VoskRecognizer* recognizer{nullptr};
    bool segment_has_text{false};
    std::string last_partial;

    ~Impl() { release_model(); }

    void load() {
        if (!model) {
            model = vosk_model_new(cfg.model_path.c_str());
            if (!model) {
                throw ConnectionError("Failed to load Vosk model at " + cfg.model_path);
            }
        }
        if (!recognizer) {
            recognizer = vosk_recognizer_new(model, static_cast<float>(cfg.sample_rate));
            if (!recognizer) {
                throw ConnectionError("Failed to create Vosk recognizer");
            }
            vosk_recognizer_set_max_alternatives(recognizer, 0);
            vosk_recognizer_set_partial_words(recognizer, false);
        }
        log_info("Vosk", "Transcription enabled using model: " + cfg.model_path);
    }

    void release_model() {
        if (recognizer) {
            vosk_recognizer_free(recognizer);
            recognizer = nullptr;
        }
        if (model) {
            vosk_model_free(model);
            model = nullptr;
        }
    }

    void emit(TranscriptEvent::Kind kind, const std::string& text) {
        if (handler) handler(TranscriptEvent{kind, text});
    }

    void process(const std::vector<int16_t>& buffer) {
        auto d = vad.update(buffer);
        if (d.latched) {
            log_info("VAD", "Speech detected (" + std::to_string(dbfs(buffer)) + " dBFS)");
        }

        if (d.in_segment) {
            int done = vosk_recognizer_accept_waveform_s(recognizer, buffer.data(),
                                                         static_cast<int>(buffer.size()));
            if (done) {
                std::string text = json_field(vosk_recognizer_result(recognizer), "text");
                if (!text.empty()) {
                    segment_has_text = true;
                    emit(TranscriptEvent::Kind::Final, text);
                }
                last_partial.clear();
            } else {
                std::string partial = json_field(vosk_recognizer_partial_result(recognizer), "partial");
                if (!partial.empty() && partial != last_partial) {
                    last_partial = partial;
                    emit(TranscriptEvent::Kind::Interim, partial);
                }
            }
        }

        if (d.segment_ended) {
            std::string text = json_field(vosk_recognizer_final_result(recognizer), "text");
            vosk_recognizer_reset(recognizer);
            last_partial.clear();
            if (!text.empty()) {
                segment_has_text = true;
                emit(TranscriptEvent::Kind::Final, text);
            }
            if (segment_has_text) {
                emit(TranscriptEvent::Kind::UtteranceEnd, {});
            } else {
                log_info("Vosk", "(no speech recognised)");
            }
            segment_has_text = false;
        }
    }
#else
    void load() {
        throw ConnectionError("Vosk support not enabled; rebuild with PARLEY_WITH_VOSK=ON");
    }
    void release_model() {}
    void process(const std::vector<int16_t>&) {}
#endif

    void run() {
        for (;;) {
            std::vector<int16_t> buffer;
            {
                std::unique_lock<std::mutex> lock(mutex);
                cv.wait(lock, [this] { return !running || !frames.empty(); });
                if (!running) return;
                buffer = std::move(frames.front());
                frames.pop_front();
            }
            process(buffer);
        }
    }
};

VoskChannel::VoskChannel(VoskConfig cfg) : impl_(std::make_unique<Impl>(std::move(cfg))) {}

VoskChannel::~VoskChannel() {
    close();
}

void VoskChannel::open(TranscriptHandler handler) {
    if (impl_->worker.joinable()) {
        throw ConnectionError("Transcription channel already open");
    }
    impl_->load();
    impl_->vad.reset();
    impl_->handler = std::move(handler);
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        impl_->frames.clear();
        impl_->running = true;
    }
    impl_->worker = std::thread(&Impl::run, impl_.get());
}

void VoskChannel::send_audio(const int16_t* samples, std::size_t count) {
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        if (!impl_->running) return;
        impl_->frames.emplace_back(samples, samples + count);
    }
    impl_->cv.notify_one();
}

void VoskChannel::close() {
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        impl_->running = false;
        impl_->frames.clear();
    }
    impl_->cv.notify_all();
    if (impl_->worker.joinable()) {
        impl_->worker.join();
    }
    impl_->handler = nullptr;
}
