#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

// Microphone as seen by the speech session.
class MicrophoneSource {
public:
    virtual ~MicrophoneSource() = default;

    virtual void start() = 0;
    // Blocks for one buffer; returns the number of samples in out.
    virtual std::size_t read(std::vector<int16_t>& out) = 0;
    // Releases the device; calling it again is a no-op.
    virtual void stop() = 0;
    // Disabled capture yields silence instead of microphone samples.
    virtual void set_enabled(bool enabled) = 0;
};
