#include "playback_scheduler.hpp"

#include <algorithm>

#include "utils.hpp"

PlaybackScheduler::PlaybackScheduler(AudioSink& sink, PlaybackConfig cfg)
    : sink_(sink), cfg_(cfg) {
    worker_ = std::thread(&PlaybackScheduler::consume, this);
}

PlaybackScheduler::~PlaybackScheduler() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        shutdown_ = true;
        queue_.clear();
        halt_ = true;
        wake_ = true;
    }
    cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
}

std::vector<float> PlaybackScheduler::decode(const std::vector<uint8_t>& pcm, std::size_t fade_samples) {
    const std::size_t count = pcm.size() / 2;
    std::vector<float> out(count);
    for (std::size_t i = 0; i < count; ++i) {
        auto lo = static_cast<uint16_t>(pcm[2 * i]);
        auto hi = static_cast<uint16_t>(pcm[2 * i + 1]);
        auto sample = static_cast<int16_t>(static_cast<uint16_t>(lo | (hi << 8)));
        out[i] = static_cast<float>(sample) / 32768.0f;
    }

    const std::size_t fade = std::min(fade_samples, count);
    for (std::size_t i = 0; i < fade; ++i) {
        const float gain = static_cast<float>(i) / static_cast<float>(fade);
        out[i] *= gain;
        out[count - 1 - i] *= gain;
    }
    return out;
}

void PlaybackScheduler::enqueue(std::vector<uint8_t> pcm, const TurnTokenPtr& token) {
    if (pcm.size() < 2) return;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutdown_) return;
        if (token && token->cancelled()) return;
        queue_.push_back(std::move(pcm));
        wake_ = true;
    }
    cv_.notify_one();
}

void PlaybackScheduler::stop() {
    bool was_playing = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.clear();
        next_start_.reset();
        halt_ = true;
        wake_ = true;
        was_playing = playing_;
        playing_ = false;
    }
    // The sink may still hold the tail of a chunk play() already returned.
    sink_.halt();
    if (was_playing) {
        log_info("Playback", "Stopped");
        notify_idle();
    }
}

void PlaybackScheduler::set_on_idle(IdleCallback cb) {
    std::unique_lock<std::mutex> lock(mutex_);
    on_idle_ = std::move(cb);
    idle_cv_.wait(lock, [this] { return idle_callbacks_ == 0; });
}

bool PlaybackScheduler::is_playing() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return playing_;
}

std::size_t PlaybackScheduler::queued() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

std::optional<double> PlaybackScheduler::next_start() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return next_start_;
}

void PlaybackScheduler::notify_idle() {
    IdleCallback cb;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!on_idle_) return;
        cb = on_idle_;
        ++idle_callbacks_;
    }
    cb();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        --idle_callbacks_;
    }
    idle_cv_.notify_all();
}

void PlaybackScheduler::consume() {
    while (true) {
        std::vector<uint8_t> pcm;
        double start_at = 0.0;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return !queue_.empty() || shutdown_; });
            if (shutdown_) break;

            pcm = std::move(queue_.front());
            queue_.pop_front();
            playing_ = true;
            halt_ = false;

            const double now = sink_.now();
            start_at = next_start_ ? std::max(*next_start_, now) : now;
            const double duration = static_cast<double>(pcm.size() / 2) / cfg_.sample_rate;
            next_start_ = start_at + duration;
        }

        try {
            sink_.play(decode(pcm, cfg_.fade_samples), cfg_.sample_rate, start_at, halt_);
        } catch (const std::exception& e) {
            log_error("Playback", std::string("Audio playback error: ") + e.what());
        }

        // Queue ran dry: let the device play out before reporting idle. A new
        // chunk or a stop() wakes the wait early.
        bool drain = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (playing_ && queue_.empty() && !shutdown_) {
                wake_ = false;
                drain = true;
            }
        }
        if (drain) {
            try {
                sink_.drain(wake_);
            } catch (const std::exception& e) {
                log_error("Playback", std::string("Audio drain error: ") + e.what());
            }
        }

        bool went_idle = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (playing_ && queue_.empty() && !shutdown_) {
                playing_ = false;
                went_idle = true;
            }
        }
        if (went_idle) notify_idle();
    }
}
