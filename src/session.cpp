#include "session.hpp"

const char* phase_name(Phase phase) {
    switch (phase) {
    case Phase::Onboarding: return "onboarding";
    case Phase::Profiling: return "profiling";
    case Phase::Complete: return "complete";
    }
    return "onboarding";
}

std::optional<Phase> parse_phase(const std::string& name) {
    if (name == "onboarding") return Phase::Onboarding;
    if (name == "profiling") return Phase::Profiling;
    if (name == "complete") return Phase::Complete;
    return std::nullopt;
}

const char* role_name(Role role) {
    return role == Role::User ? "user" : "assistant";
}

void Session::set_transcript_listener(TranscriptListener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    listener_ = std::move(listener);
}

Phase Session::phase() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return phase_;
}

void Session::set_phase(Phase phase) {
    std::lock_guard<std::mutex> lock(mutex_);
    phase_ = phase;
}

std::optional<OnboardingResult> Session::onboarding_result() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return onboarding_result_;
}

void Session::set_onboarding_result(const OnboardingResult& result) {
    std::lock_guard<std::mutex> lock(mutex_);
    onboarding_result_ = result;
}

std::optional<LearnerProfile> Session::learner_profile() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return learner_profile_;
}

void Session::set_learner_profile(const LearnerProfile& profile) {
    std::lock_guard<std::mutex> lock(mutex_);
    learner_profile_ = profile;
}

void Session::append(Role role, const std::string& content) {
    std::unique_lock<std::mutex> lock(mutex_);
    messages_.push_back({role, content});
    notify(lock);
}

void Session::begin_assistant_message() {
    std::unique_lock<std::mutex> lock(mutex_);
    messages_.push_back({Role::Assistant, {}});
    notify(lock);
}

void Session::append_assistant_text(const std::string& delta) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (messages_.empty() || messages_.back().role != Role::Assistant) {
        messages_.push_back({Role::Assistant, {}});
    }
    messages_.back().content += delta;
    notify(lock);
}

std::vector<Message> Session::messages() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return messages_;
}

std::size_t Session::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return messages_.size();
}

void Session::reset() {
    std::unique_lock<std::mutex> lock(mutex_);
    phase_ = Phase::Onboarding;
    messages_.clear();
    onboarding_result_.reset();
    learner_profile_.reset();
    notify(lock);
}

void Session::notify(std::unique_lock<std::mutex>& lock) {
    if (!listener_) return;
    auto listener = listener_;
    auto snapshot = messages_;
    lock.unlock();
    listener(snapshot);
}
