#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

struct TranscriptEvent {
    enum class Kind {
        Interim,      // provisional text, may still change
        Final,        // settled fragment of the utterance
        UtteranceEnd, // the service detected the end of the utterance
        Closed,       // remote side closed the channel
        Error
    };

    Kind kind{Kind::Interim};
    std::string text;
};

using TranscriptHandler = std::function<void(const TranscriptEvent&)>;

// Live speech-to-text channel: captured audio goes out, transcript events
// come back on the channel's own thread.
class TranscriptionChannel {
public:
    virtual ~TranscriptionChannel() = default;

    // Blocks until the channel is ready for audio. Throws ConnectionError.
    virtual void open(TranscriptHandler handler) = 0;

    // 16-bit mono frames at the capture rate.
    virtual void send_audio(const int16_t* samples, std::size_t count) = 0;

    // Idempotent; no events are delivered once it returns.
    virtual void close() = 0;
};
