// End-to-end turns through the wired conversation, using fake devices and services.

#include <algorithm>
#include <cmath>
#include <memory>

#include "conversation.hpp"
#include "test_support.hpp"

namespace {

using Kind = TranscriptEvent::Kind;
using std::chrono::milliseconds;

ConversationConfig fast_config() {
    ConversationConfig cfg;
    cfg.speech.silence_timeout = milliseconds(200);
    cfg.interruption.echo_cooldown = milliseconds(150);
    return cfg;
}

struct Rig {
    // Declared ahead of the conversation so they outlive its workers.
    std::mutex mutex;
    std::vector<std::string> statuses;

    FakeSink sink;
    FakeSynthesis synthesis;
    FakeChat chat;
    FakeChannel channel;
    FakeMic mic;
    Conversation conversation{sink, synthesis, chat, channel, mic, fast_config()};

    Rig() {
        conversation.set_status_listener([this](const std::string& s) {
            std::lock_guard<std::mutex> lock(mutex);
            statuses.push_back(s);
        });
    }

    ~Rig() {
        conversation.shutdown();
    }

    void say(Kind kind, const std::string& text = {}) {
        channel.emit(kind, text);
        conversation.speech().drain_events();
    }

    bool saw_status(const std::string& s) {
        std::lock_guard<std::mutex> lock(mutex);
        return std::find(statuses.begin(), statuses.end(), s) != statuses.end();
    }
};

TestResult test_spoken_turn() {
    TestResult result;
    result.name = "Conversation - Utterance To Gapless Spoken Reply";

    Rig rig;
    rig.synthesis.bytes_per_sentence = 48000;
    rig.chat.script(FakeChat::stream({"Photosynthesis is how plants ", "[chuckles] make food from light."}));

    rig.conversation.start_listening();
    rig.say(Kind::Interim, "What is");
    rig.say(Kind::Final, "What is photosynthesis?");
    rig.say(Kind::UtteranceEnd);

    if (!wait_until([&] { return rig.chat.request_count() == 1; })) {
        result.details = "utterance never reached the chat backend";
        return result;
    }
    auto request = rig.chat.requests()[0];
    if (request.messages.size() != 1 || request.messages[0].content != "What is photosynthesis?") {
        result.details = "request did not carry the utterance";
        return result;
    }

    const std::string sentence = "Photosynthesis is how plants [chuckles] make food from light.";
    if (!wait_until([&] { return rig.synthesis.requests().size() == 1; })) {
        result.details = "reply never synthesized";
        return result;
    }
    if (rig.synthesis.requests()[0] != sentence) {
        result.details = "synthesized '" + rig.synthesis.requests()[0] + "'";
        return result;
    }

    if (!wait_until([&] {
            std::size_t n = 0;
            for (const auto& p : rig.sink.played()) n += p.samples;
            return n == 24000;
        })) {
        result.details = "reply audio not fully played";
        return result;
    }
    auto played = rig.sink.played();
    if (played.empty() || played[0].samples < 12000) {
        result.details = "first chunk smaller than 24000 bytes";
        return result;
    }
    for (std::size_t i = 1; i < played.size(); ++i) {
        if (std::fabs(played[i].start_at - (played[i - 1].start_at + played[i - 1].duration)) > 1e-9) {
            result.details = "gap before chunk " + std::to_string(i);
            return result;
        }
    }

    auto messages = rig.conversation.session().messages();
    if (messages.size() != 2 || messages[1].content != "Photosynthesis is how plants [chuckles] make food from light.") {
        result.details = "transcript log incomplete";
        return result;
    }
    if (!rig.saw_status("Thinking...") || !rig.saw_status("Listening...")) {
        result.details = "status updates missing";
        return result;
    }
    result.passed = true;
    result.details = std::to_string(played.size()) + " chunks, back to back";
    return result;
}

TestResult test_barge_in_mid_reply() {
    TestResult result;
    result.name = "Conversation - Barge-In Mid Reply";

    Rig rig;
    rig.sink.set_hold(true);
    rig.synthesis.bytes_per_sentence = 24000;
    rig.chat.script(FakeChat::stream({"First sentence here. ", "Second sentence here. ", "Third one."}));

    rig.conversation.start_listening();
    rig.say(Kind::Final, "Tell me a story");
    rig.say(Kind::UtteranceEnd);

    if (!wait_until([&] { return rig.sink.started() == 1; })) {
        result.details = "assistant never started speaking";
        return result;
    }
    auto token = rig.conversation.coordinator().current_turn();

    rig.say(Kind::Interim, "wait");

    if (!token || !token->cancelled()) {
        result.details = "turn not cancelled";
        return result;
    }
    if (!wait_until([&] { return rig.sink.played().size() == 1 && !rig.conversation.tts().busy(); })) {
        result.details = "playback or synthesis kept running";
        return result;
    }
    if (!rig.sink.played()[0].halted) {
        result.details = "sounding chunk not cut mid-flight";
        return result;
    }
    if (rig.conversation.tts().pending() != 0 || rig.conversation.playback().queued() != 0) {
        result.details = "queues not emptied";
        return result;
    }
    if (!rig.conversation.coordinator().cooldown_deadline()) {
        result.details = "cooldown deadline not set";
        return result;
    }
    if (!rig.conversation.speech().buffered().empty()) {
        result.details = "utterance buffer not discarded";
        return result;
    }

    rig.sink.set_hold(false);
    if (!wait_until([&] { return !rig.conversation.coordinator().in_echo_cooldown(); })) {
        result.details = "cooldown never elapsed";
        return result;
    }
    rig.say(Kind::Final, "Actually make it short");
    rig.say(Kind::UtteranceEnd);
    if (!wait_until([&] { return rig.chat.request_count() == 2; })) {
        result.details = "follow-up utterance not sent";
        return result;
    }
    auto second = rig.chat.requests()[1];
    if (second.messages.back().content != "Actually make it short") {
        result.details = "second turn carried '" + second.messages.back().content + "'";
        return result;
    }
    result.passed = true;
    return result;
}

TestResult test_reset() {
    TestResult result;
    result.name = "Conversation - Reset Returns To Onboarding";

    Rig rig;
    ChatReply transition;
    transition.kind = ChatReply::Kind::PhaseTransition;
    transition.new_phase = Phase::Profiling;
    transition.onboarding_result = OnboardingResult{"chess", "fun", "Wants to play chess"};
    rig.chat.script(FakeChat::reply(transition));

    rig.conversation.start_listening();
    rig.say(Kind::Final, "chess");
    rig.say(Kind::UtteranceEnd);
    if (!wait_until([&] { return rig.conversation.session().phase() == Phase::Profiling; })) {
        result.details = "phase never changed";
        return result;
    }
    if (!wait_until([&] { return !rig.conversation.dispatcher().busy(); })) {
        result.details = "turn did not settle";
        return result;
    }

    rig.conversation.reset();
    auto& session = rig.conversation.session();
    if (session.phase() != Phase::Onboarding || session.size() != 0 || session.onboarding_result()) {
        result.details = "session not reset";
        return result;
    }
    if (rig.conversation.speech().state() != SpeechState::Listening) {
        result.details = "reset stopped listening";
        return result;
    }
    result.passed = true;
    return result;
}

TestResult test_stop_and_restart() {
    TestResult result;
    result.name = "Conversation - Stop And Restart Listening";

    Rig rig;
    rig.conversation.start_listening();
    rig.conversation.set_muted(true);
    if (rig.conversation.status() != "Muted" || !rig.conversation.muted()) {
        result.details = "status after mute '" + rig.conversation.status() + "'";
        return result;
    }
    rig.conversation.set_muted(false);

    rig.conversation.stop_listening();
    rig.conversation.stop_listening();
    if (rig.channel.closes() != 1 || rig.mic.stops() != 1) {
        result.details = "resources released " + std::to_string(rig.channel.closes()) + " times";
        return result;
    }
    if (rig.conversation.status() != "Tap to start") {
        result.details = "status after stop '" + rig.conversation.status() + "'";
        return result;
    }

    rig.conversation.start_listening();
    if (rig.channel.opens() != 2 || rig.conversation.status() != "Listening...") {
        result.details = "restart failed";
        return result;
    }

    rig.conversation.shutdown();
    rig.conversation.shutdown();
    if (rig.channel.closes() != 2) {
        result.details = "shutdown did not release the channel once";
        return result;
    }
    result.passed = true;
    return result;
}

TestResult test_reset_drops_pending_utterance() {
    TestResult result;
    result.name = "Conversation - Reset Drops An Utterance Still In Flight";

    Rig rig;
    rig.synthesis.bytes_per_sentence = 4800;
    rig.conversation.start_listening();

    // Reset lands at every point between the utterance end and its turn.
    for (int i = 0; i < 25; ++i) {
        rig.chat.script(FakeChat::stream({"One. ", "Two. ", "Three."}));
        rig.channel.emit(Kind::Final, "hello");
        rig.channel.emit(Kind::UtteranceEnd);
        if (i % 5 != 0) {
            std::this_thread::sleep_for(milliseconds(i % 5));
        }
        rig.conversation.reset();

        if (rig.conversation.session().size() != 0) {
            result.details = "round " + std::to_string(i) + " left " +
                             std::to_string(rig.conversation.session().size()) + " messages";
            return result;
        }
    }

    std::this_thread::sleep_for(milliseconds(300));
    if (rig.conversation.session().size() != 0 || rig.conversation.dispatcher().busy()) {
        result.details = "a turn started after the last reset";
        return result;
    }
    if (!rig.conversation.speech().buffered().empty()) {
        result.details = "speech fragments survived the reset";
        return result;
    }
    result.passed = true;
    return result;
}

TestResult test_teardown_mid_turn() {
    TestResult result;
    result.name = "Conversation - Teardown Mid Turn Calls Nobody Back";

    FakeSink sink;
    FakeSynthesis synthesis;
    FakeChat chat;
    FakeChannel channel;
    FakeMic mic;
    chat.script(FakeChat::hang());

    std::atomic<bool> torn_down{false};
    std::atomic<int> thinking{0};
    std::atomic<int> late{0};

    auto conversation = std::make_unique<Conversation>(sink, synthesis, chat, channel, mic, fast_config());
    conversation->set_status_listener([&](const std::string& s) {
        if (torn_down.load()) late.fetch_add(1);
        if (s == "Thinking...") thinking.fetch_add(1);
    });
    conversation->set_preview_listener([&](const std::string&) {
        if (torn_down.load()) late.fetch_add(1);
    });
    conversation->set_transcript_listener([&](const std::vector<Message>&) {
        if (torn_down.load()) late.fetch_add(1);
    });

    conversation->start_listening();
    channel.emit(Kind::Final, "Tell me about rivers");
    channel.emit(Kind::UtteranceEnd);
    conversation->speech().drain_events();

    if (!wait_until([&] { return thinking.load() == 1; })) {
        result.details = "turn never reached the backend";
        return result;
    }

    // The turn is parked in the backend; the worker settles only after cancellation.
    torn_down = true;
    conversation.reset();

    if (late.load() != 0) {
        result.details = std::to_string(late.load()) + " callbacks after teardown began";
        return result;
    }
    if (channel.closes() != 1 || mic.stops() != 1) {
        result.details = "devices not released on teardown";
        return result;
    }
    result.passed = true;
    return result;
}

} // namespace

int main() {
    std::vector<TestResult> results;
    results.push_back(test_spoken_turn());
    results.push_back(test_barge_in_mid_reply());
    results.push_back(test_reset());
    results.push_back(test_reset_drops_pending_utterance());
    results.push_back(test_stop_and_restart());
    results.push_back(test_teardown_mid_turn());
    return report("CONVERSATION", results);
}
