#pragma once

#include <cstdint>
#include <vector>

struct VadConfig {
    float trigger_dbfs = -35.0f; // level above which a buffer counts as speech-like
    int trigger_frames = 10;     // consecutive speech-like buffers before latching
    int release_frames = 20;     // buffers kept open after the latch
};

// Energy gate over capture buffers. Decides which buffers belong to a
// speech segment and when that segment ends.
class VoiceActivityDetector {
public:
    struct Decision {
        bool speech_like{false};
        bool in_segment{false};  // buffer belongs to the current segment
        bool segment_ended{false};
        bool latched{false};     // sustained speech detected on this buffer
    };

    explicit VoiceActivityDetector(VadConfig cfg = {});

    Decision update(float level_dbfs);
    Decision update(const std::vector<int16_t>& buffer);

    void reset();
    bool active() const { return active_; }

private:
    VadConfig cfg_;
    int hot_{0};
    int hold_{0};
    bool active_{false};
};
