#pragma once

#include <atomic>
#include <vector>

// Output device seen by the playback scheduler.
class AudioSink {
public:
    virtual ~AudioSink() = default;

    // Current position of the output clock, in seconds.
    virtual double now() const = 0;

    // Plays mono samples in [-1, 1] so they begin at start_at on the output
    // clock. Blocks until the chunk has been handed off, or returns early
    // once halt becomes true, cutting the chunk off mid-flight.
    virtual void play(const std::vector<float>& samples,
                      int sample_rate,
                      double start_at,
                      const std::atomic<bool>& halt) = 0;

    // Blocks until audio already handed off has sounded, or wake becomes true.
    virtual void drain(const std::atomic<bool>& wake) = 0;

    // Discards audio already handed off. Safe from any thread, also while
    // play() runs on another.
    virtual void halt() = 0;
};
