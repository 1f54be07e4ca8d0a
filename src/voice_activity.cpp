#include "voice_activity.hpp"

#include "utils.hpp"

VoiceActivityDetector::VoiceActivityDetector(VadConfig cfg) : cfg_(cfg) {}

VoiceActivityDetector::Decision VoiceActivityDetector::update(float level_dbfs) {
    Decision d;
    d.speech_like = level_dbfs > cfg_.trigger_dbfs;

    if (d.speech_like) {
        hot_++;
        if (hot_ >= cfg_.trigger_frames) {
            hold_ = cfg_.release_frames;
            hot_ = 0;
            d.latched = true;
        }
    } else {
        hot_ = 0;
    }

    if (hold_ > 0) {
        hold_--;
    }

    if (d.speech_like || hold_ > 0) {
        active_ = true;
        d.in_segment = true;
    }

    if (!d.speech_like && hold_ == 0 && active_) {
        active_ = false;
        d.segment_ended = true;
    }
    return d;
}

VoiceActivityDetector::Decision VoiceActivityDetector::update(const std::vector<int16_t>& buffer) {
    return update(dbfs(buffer));
}

void VoiceActivityDetector::reset() {
    hot_ = 0;
    hold_ = 0;
    active_ = false;
}
