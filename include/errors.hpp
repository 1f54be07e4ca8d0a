#pragma once

#include <stdexcept>
#include <string>

// Transcription channel or microphone could not be opened.
class ConnectionError : public std::runtime_error {
public:
    explicit ConnectionError(const std::string& what) : std::runtime_error(what) {}
};

// Chat or synthesis call returned a non-success status or a malformed reply.
class BackendError : public std::runtime_error {
public:
    explicit BackendError(const std::string& what, long status = 0)
        : std::runtime_error(what), status_(status) {}

    long status() const { return status_; }

private:
    long status_;
};

// The turn token fired while an operation was in flight. Expected, never surfaced.
class CancellationError : public std::runtime_error {
public:
    CancellationError() : std::runtime_error("cancelled") {}
};
