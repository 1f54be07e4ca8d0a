#include "interruption.hpp"

#include "utils.hpp"

InterruptionCoordinator::InterruptionCoordinator(TtsStreamClient& tts,
                                                 PlaybackScheduler& playback,
                                                 InterruptionConfig cfg,
                                                 NowFn now)
    : tts_(tts), playback_(playback), cfg_(cfg), now_(std::move(now)) {
    if (!now_) {
        now_ = [] { return Clock::now(); };
    }
    playback_.set_on_idle([this] { on_playback_idle(); });
}

InterruptionCoordinator::~InterruptionCoordinator() {
    playback_.set_on_idle(nullptr);
}

TurnTokenPtr InterruptionCoordinator::begin_turn() {
    interrupt();

    std::lock_guard<std::mutex> lock(mutex_);
    current_ = std::make_shared<TurnToken>(next_id_++);
    request_in_flight_ = true;
    return current_;
}

void InterruptionCoordinator::end_request(const TurnTokenPtr& token) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (token == current_) {
        request_in_flight_ = false;
    }
}

TurnTokenPtr InterruptionCoordinator::current_turn() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_;
}

bool InterruptionCoordinator::interrupt() {
    const bool was_active = assistant_active();

    TurnTokenPtr token;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        token = current_;
        request_in_flight_ = false;
    }

    // Token first: any chunk racing into the scheduler after stop() is rejected.
    if (token && token->cancel()) {
        log_info("Interrupt", "Cancelled turn " + std::to_string(token->id()));
    }
    tts_.clear();
    playback_.stop();
    return was_active;
}

bool InterruptionCoordinator::assistant_active() const {
    TurnTokenPtr token;
    bool in_flight = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        token = current_;
        in_flight = request_in_flight_;
    }
    if (!token || token->cancelled()) return false;
    return in_flight || tts_.busy() || playback_.is_playing();
}

void InterruptionCoordinator::on_playback_idle() {
    std::lock_guard<std::mutex> lock(mutex_);
    cooldown_until_ = now_() + cfg_.echo_cooldown;
}

bool InterruptionCoordinator::in_echo_cooldown() const {
    return in_echo_cooldown(now_());
}

bool InterruptionCoordinator::in_echo_cooldown(Clock::time_point now) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cooldown_until_ && now < *cooldown_until_;
}

std::optional<InterruptionCoordinator::Clock::time_point> InterruptionCoordinator::cooldown_deadline() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cooldown_until_;
}

void InterruptionCoordinator::clear_cooldown() {
    std::lock_guard<std::mutex> lock(mutex_);
    cooldown_until_.reset();
}
