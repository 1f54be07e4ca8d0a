#include "tts_stream.hpp"

#include "errors.hpp"
#include "utils.hpp"

std::optional<std::vector<uint8_t>> PcmChunker::feed(const char* data, std::size_t len) {
    leftover_.insert(leftover_.end(), data, data + len);

    // PCM 16-bit = 2 bytes per sample; ensure even byte count
    const std::size_t usable = leftover_.size() - (leftover_.size() % 2);
    if (usable < min_bytes_) return std::nullopt;

    std::vector<uint8_t> chunk(leftover_.begin(), leftover_.begin() + static_cast<std::ptrdiff_t>(usable));
    leftover_.erase(leftover_.begin(), leftover_.begin() + static_cast<std::ptrdiff_t>(usable));
    return chunk;
}

std::optional<std::vector<uint8_t>> PcmChunker::flush() {
    const std::size_t usable = leftover_.size() - (leftover_.size() % 2);
    std::optional<std::vector<uint8_t>> out;
    if (usable >= 2) {
        out.emplace(leftover_.begin(), leftover_.begin() + static_cast<std::ptrdiff_t>(usable));
    }
    leftover_.clear();
    return out;
}

TtsStreamClient::TtsStreamClient(SynthesisBackend& backend, PlaybackScheduler& scheduler, TtsConfig cfg)
    : backend_(backend), scheduler_(scheduler), cfg_(cfg) {
    worker_ = std::thread(&TtsStreamClient::drain, this);
}

TtsStreamClient::~TtsStreamClient() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        shutdown_ = true;
        queue_.clear();
    }
    cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
}

void TtsStreamClient::enqueue(std::string sentence, TurnTokenPtr token) {
    if (!token || token->cancelled()) return;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutdown_) return;
        queue_.push_back({std::move(sentence), std::move(token)});
    }
    cv_.notify_one();
}

void TtsStreamClient::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    queue_.clear();
}

bool TtsStreamClient::busy() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return draining_ || !queue_.empty();
}

std::size_t TtsStreamClient::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

void TtsStreamClient::drain() {
    while (true) {
        Entry entry;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            draining_ = false;
            cv_.wait(lock, [this] { return !queue_.empty() || shutdown_; });
            if (shutdown_) break;

            entry = std::move(queue_.front());
            queue_.pop_front();
            draining_ = true;
        }

        if (entry.token->cancelled()) continue;

        try {
            speak_sentence(entry);
        } catch (const CancellationError&) {
            log_info("TTS", "Sentence cancelled");
        } catch (const BackendError& e) {
            log_error("TTS", std::string("Sentence dropped: ") + e.what());
        } catch (const std::exception& e) {
            log_error("TTS", std::string("Sentence error: ") + e.what());
        }
    }
}

void TtsStreamClient::speak_sentence(const Entry& entry) {
    const TurnToken& token = *entry.token;
    log_info("TTS", "Speaking sentence: " + preview(entry.sentence));

    PcmChunker chunker(cfg_.min_buffer_bytes);
    backend_.synthesize(entry.sentence, token, [&](const char* data, std::size_t len) {
        if (token.cancelled()) return false;
        if (auto chunk = chunker.feed(data, len)) {
            scheduler_.enqueue(std::move(*chunk), entry.token);
        }
        return true;
    });

    token.throw_if_cancelled();
    if (auto rest = chunker.flush()) {
        scheduler_.enqueue(std::move(*rest), entry.token);
    }
    log_info("TTS", "Sentence done");
}
