#pragma once

#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

enum class Phase { Onboarding, Profiling, Complete };

const char* phase_name(Phase phase);
std::optional<Phase> parse_phase(const std::string& name);

enum class Role { User, Assistant };

const char* role_name(Role role);

struct Message {
    Role role;
    std::string content;
};

// What the onboarding phase extracted: what the user wants to learn and why.
struct OnboardingResult {
    std::string subject;
    std::string reason;
    std::string summary;
};

struct LearnerProfile {
    std::string subject;
    std::string reason;
    std::string summary;
    std::string starting_level;
    std::string depth;
    std::vector<std::string> focus_areas;
    std::vector<std::string> skip_areas;
    std::string learner_context;
    std::string notes;
};

// State of the single active conversation. Thread safe; every mutation
// notifies the transcript listener with a snapshot of the log.
class Session {
public:
    using TranscriptListener = std::function<void(const std::vector<Message>&)>;

    void set_transcript_listener(TranscriptListener listener);

    Phase phase() const;
    void set_phase(Phase phase);
    bool complete() const { return phase() == Phase::Complete; }

    std::optional<OnboardingResult> onboarding_result() const;
    void set_onboarding_result(const OnboardingResult& result);

    std::optional<LearnerProfile> learner_profile() const;
    void set_learner_profile(const LearnerProfile& profile);

    void append(Role role, const std::string& content);

    // Opens an empty assistant message that append_assistant_text() grows.
    void begin_assistant_message();
    void append_assistant_text(const std::string& delta);

    std::vector<Message> messages() const;
    std::size_t size() const;

    void reset();

private:
    void notify(std::unique_lock<std::mutex>& lock);

    mutable std::mutex mutex_;
    Phase phase_{Phase::Onboarding};
    std::vector<Message> messages_;
    std::optional<OnboardingResult> onboarding_result_;
    std::optional<LearnerProfile> learner_profile_;
    TranscriptListener listener_;
};
