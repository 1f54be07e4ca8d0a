// Gapless scheduling, stop and fades on the playback scheduler.

#include <cmath>

#include "playback_scheduler.hpp"
#include "test_support.hpp"

namespace {

bool near(double a, double b) {
    return std::fabs(a - b) < 1e-9;
}

TestResult test_gapless_starts() {
    TestResult result;
    result.name = "Playback - Chunks Start Where The Previous Ends";

    FakeSink sink;
    PlaybackScheduler scheduler(sink);

    // 4800 bytes = 2400 samples = 100 ms at 24 kHz
    scheduler.enqueue(pcm_bytes(4800));
    scheduler.enqueue(pcm_bytes(4800));
    scheduler.enqueue(pcm_bytes(9600));

    if (!wait_until([&] { return sink.played().size() == 3; })) {
        result.details = "only " + std::to_string(sink.played().size()) + " chunks played";
        return result;
    }

    auto played = sink.played();
    for (std::size_t i = 1; i < played.size(); ++i) {
        const double expected = played[i - 1].start_at + played[i - 1].duration;
        if (!near(played[i].start_at, expected)) {
            result.details = "chunk " + std::to_string(i) + " starts at " + std::to_string(played[i].start_at)
                           + ", expected " + std::to_string(expected);
            return result;
        }
    }
    if (!near(played[0].start_at, 0.0) || !near(played[2].start_at, 0.2)) {
        result.details = "unexpected start times";
        return result;
    }
    auto next = scheduler.next_start();
    if (!next || !near(*next, 0.4)) {
        result.details = "next start not 0.4";
        return result;
    }
    result.passed = true;
    result.details = "3 chunks, zero gap and zero overlap";
    return result;
}

TestResult test_clock_behind() {
    TestResult result;
    result.name = "Playback - Late Chunk Starts At Current Time";

    FakeSink sink;
    PlaybackScheduler scheduler(sink);

    scheduler.enqueue(pcm_bytes(4800));
    if (!wait_until([&] { return sink.played().size() == 1 && !scheduler.is_playing(); })) {
        result.details = "first chunk did not finish";
        return result;
    }

    sink.set_clock(5.0);
    scheduler.enqueue(pcm_bytes(4800));
    if (!wait_until([&] { return sink.played().size() == 2; })) {
        result.details = "second chunk not played";
        return result;
    }
    if (!near(sink.played()[1].start_at, 5.0)) {
        result.details = "second chunk started at " + std::to_string(sink.played()[1].start_at);
        return result;
    }
    result.passed = true;
    return result;
}

TestResult test_stop_halts_and_clears() {
    TestResult result;
    result.name = "Playback - Stop Halts Audio And Empties Queue";

    FakeSink sink;
    sink.set_hold(true);
    PlaybackScheduler scheduler(sink);

    std::atomic<int> idle_calls{0};
    scheduler.set_on_idle([&] { idle_calls.fetch_add(1); });

    for (int i = 0; i < 5; ++i) scheduler.enqueue(pcm_bytes(4800));
    if (!wait_until([&] { return sink.started() == 1; })) {
        result.details = "first chunk never started";
        return result;
    }

    scheduler.stop();
    scheduler.stop();

    if (!wait_until([&] { return sink.played().size() == 1; })) {
        result.details = "halted chunk did not return";
        return result;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    if (sink.started() != 1) {
        result.details = std::to_string(sink.started()) + " chunks started after stop";
        return result;
    }
    if (!sink.played()[0].halted) {
        result.details = "chunk in flight was not halted";
        return result;
    }
    if (scheduler.queued() != 0 || scheduler.is_playing() || scheduler.next_start()) {
        result.details = "scheduler state not reset";
        return result;
    }
    if (idle_calls.load() != 1) {
        result.details = "idle fired " + std::to_string(idle_calls.load()) + " times";
        return result;
    }

    // Fresh audio after a stop starts from the current clock again.
    sink.set_hold(false);
    sink.set_clock(2.0);
    scheduler.enqueue(pcm_bytes(4800));
    if (!wait_until([&] { return sink.played().size() == 2; })) {
        result.details = "playback did not resume after stop";
        return result;
    }
    if (!near(sink.played()[1].start_at, 2.0)) {
        result.details = "resumed chunk at " + std::to_string(sink.played()[1].start_at);
        return result;
    }
    result.passed = true;
    return result;
}

TestResult test_idle_after_drain() {
    TestResult result;
    result.name = "Playback - Idle Fires Once When Queue Runs Dry";

    FakeSink sink;
    PlaybackScheduler scheduler(sink);
    std::atomic<int> idle_calls{0};
    scheduler.set_on_idle([&] { idle_calls.fetch_add(1); });

    scheduler.enqueue(pcm_bytes(4800));
    scheduler.enqueue(pcm_bytes(4800));
    if (!wait_until([&] { return idle_calls.load() >= 1; })) {
        result.details = "idle never fired";
        return result;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    if (sink.played().size() != 2) {
        result.details = "played " + std::to_string(sink.played().size()) + " chunks";
        return result;
    }
    if (idle_calls.load() > 2) {
        result.details = "idle fired " + std::to_string(idle_calls.load()) + " times";
        return result;
    }
    result.passed = true;
    return result;
}

TestResult test_idle_waits_for_device() {
    TestResult result;
    result.name = "Playback - Idle Waits Until The Device Has Played Out";

    FakeSink sink;
    sink.set_hold_drain(true);
    PlaybackScheduler scheduler(sink);
    std::atomic<int> idle_calls{0};
    scheduler.set_on_idle([&] { idle_calls.fetch_add(1); });

    scheduler.enqueue(pcm_bytes(4800));
    if (!wait_until([&] { return sink.drains() == 1; })) {
        result.details = "scheduler never waited on the device";
        return result;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    if (idle_calls.load() != 0 || !scheduler.is_playing()) {
        result.details = "idle reported while audio was still queued on the device";
        return result;
    }

    // A chunk arriving mid-drain continues the reply without an idle in between.
    scheduler.enqueue(pcm_bytes(4800));
    if (!wait_until([&] { return sink.played().size() == 2 && sink.drains() == 2; })) {
        result.details = "new chunk did not cut the wait short";
        return result;
    }
    if (idle_calls.load() != 0) {
        result.details = "idle fired between chunks";
        return result;
    }

    sink.set_hold_drain(false);
    if (!wait_until([&] { return idle_calls.load() == 1; })) {
        result.details = "idle never fired after the device drained";
        return result;
    }
    if (scheduler.is_playing()) {
        result.details = "still playing after idle";
        return result;
    }
    result.passed = true;
    return result;
}

TestResult test_stop_after_idle_drops_tail() {
    TestResult result;
    result.name = "Playback - Stop While Idle Still Silences The Device";

    FakeSink sink;
    PlaybackScheduler scheduler(sink);
    std::atomic<int> idle_calls{0};
    scheduler.set_on_idle([&] { idle_calls.fetch_add(1); });

    scheduler.enqueue(pcm_bytes(4800));
    if (!wait_until([&] { return idle_calls.load() == 1; })) {
        result.details = "playback never went idle";
        return result;
    }
    if (sink.halts() != 0) {
        result.details = "device halted without a stop";
        return result;
    }

    scheduler.stop();
    if (sink.halts() != 1) {
        result.details = "stop did not reach the device";
        return result;
    }
    if (idle_calls.load() != 1) {
        result.details = "stop while idle reported idle again";
        return result;
    }
    result.passed = true;
    return result;
}

TestResult test_replacing_idle_callback_waits() {
    TestResult result;
    result.name = "Playback - Replacing The Idle Callback Waits For A Running One";

    FakeSink sink;
    PlaybackScheduler scheduler(sink);
    std::atomic<bool> entered{false};
    std::atomic<bool> finished{false};
    scheduler.set_on_idle([&] {
        entered = true;
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        finished = true;
    });

    scheduler.enqueue(pcm_bytes(4800));
    if (!wait_until([&] { return entered.load(); })) {
        result.details = "idle callback never ran";
        return result;
    }

    scheduler.set_on_idle(nullptr);
    if (!finished.load()) {
        result.details = "callback target could be destroyed while still in use";
        return result;
    }
    result.passed = true;
    return result;
}

TestResult test_drops_invalid_chunks() {
    TestResult result;
    result.name = "Playback - Drops Empty And Cancelled Chunks";

    FakeSink sink;
    PlaybackScheduler scheduler(sink);

    auto token = std::make_shared<TurnToken>(1);
    token->cancel();

    scheduler.enqueue(pcm_bytes(1));
    scheduler.enqueue({});
    scheduler.enqueue(pcm_bytes(4800), token);

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    if (!sink.played().empty()) {
        result.details = std::to_string(sink.played().size()) + " chunks played";
        return result;
    }
    result.passed = true;
    return result;
}

TestResult test_decode_fades() {
    TestResult result;
    result.name = "Playback - Decode Normalizes And Ramps Edges";

    // 200 samples of 16384 (0.5 full scale), little endian
    std::vector<uint8_t> pcm;
    for (int i = 0; i < 200; ++i) {
        pcm.push_back(0x00);
        pcm.push_back(0x40);
    }
    auto out = PlaybackScheduler::decode(pcm, 48);

    if (out.size() != 200) {
        result.details = "decoded " + std::to_string(out.size()) + " samples";
        return result;
    }
    if (out[0] != 0.0f || out[199] != 0.0f) {
        result.details = "edges not silent";
        return result;
    }
    if (std::fabs(out[24] - 0.5f * 24.0f / 48.0f) > 1e-6f) {
        result.details = "fade-in sample 24 is " + std::to_string(out[24]);
        return result;
    }
    if (std::fabs(out[100] - 0.5f) > 1e-6f) {
        result.details = "middle sample is " + std::to_string(out[100]);
        return result;
    }

    std::vector<uint8_t> negative{0x00, 0x80, 0xFF, 0x7F};
    auto extremes = PlaybackScheduler::decode(negative, 0);
    if (extremes[0] != -1.0f || std::fabs(extremes[1] - 32767.0f / 32768.0f) > 1e-6f) {
        result.details = "int16 extremes decoded wrong";
        return result;
    }
    result.passed = true;
    return result;
}

} // namespace

int main() {
    std::vector<TestResult> results;
    results.push_back(test_gapless_starts());
    results.push_back(test_clock_behind());
    results.push_back(test_stop_halts_and_clears());
    results.push_back(test_idle_after_drain());
    results.push_back(test_idle_waits_for_device());
    results.push_back(test_stop_after_idle_drops_tail());
    results.push_back(test_replacing_idle_callback_waits());
    results.push_back(test_drops_invalid_chunks());
    results.push_back(test_decode_fades());
    return report("PLAYBACK SCHEDULER", results);
}
