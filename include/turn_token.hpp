#pragma once

#include <atomic>
#include <cstdint>
#include <memory>

#include "errors.hpp"

// Cancellation context for one conversation turn. Every network call, queued
// sentence and playback enqueue of the turn carries it; cancel() aborts them all.
class TurnToken {
public:
    explicit TurnToken(std::uint64_t id) : id_(id) {}

    TurnToken(const TurnToken&) = delete;
    TurnToken& operator=(const TurnToken&) = delete;

    std::uint64_t id() const { return id_; }

    // Returns true only for the call that actually cancelled.
    bool cancel() { return !cancelled_.exchange(true); }
    bool cancelled() const { return cancelled_.load(); }

    void throw_if_cancelled() const {
        if (cancelled()) throw CancellationError();
    }

private:
    std::uint64_t id_;
    std::atomic<bool> cancelled_{false};
};

using TurnTokenPtr = std::shared_ptr<TurnToken>;
