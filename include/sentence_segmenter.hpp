#pragma once

#include <optional>
#include <string>
#include <vector>

// Splits an incrementally arriving reply into speakable sentences.
//
// A sentence ends at a terminator (. ! ? or the ellipsis character) that is
// followed by whitespace or by '[' (inline delivery cues such as "[laughs]").
// A terminator at the end of the buffered text waits for the next chunk, so
// the emitted sequence does not depend on how the text was chunked.
class SentenceSegmenter {
public:
    // Appends a chunk and returns every sentence it completed, in order.
    std::vector<std::string> feed(const std::string& chunk);

    // End of stream: the trimmed remainder, if any.
    std::optional<std::string> finish();

    void reset() { buffer_.clear(); }
    const std::string& pending() const { return buffer_; }

private:
    // Index one past the terminator of the earliest complete sentence, or npos.
    std::size_t find_boundary() const;

    std::string buffer_;
};
