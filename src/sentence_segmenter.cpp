#include "sentence_segmenter.hpp"

#include "utils.hpp"

namespace {

// UTF-8 encoding of U+2026 HORIZONTAL ELLIPSIS.
const char kEllipsis[] = "\xE2\x80\xA6";
constexpr std::size_t kEllipsisLen = 3;

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

bool opens_sentence_gap(char c) {
    return is_space(c) || c == '[';
}

} // namespace

std::size_t SentenceSegmenter::find_boundary() const {
    for (std::size_t i = 0; i < buffer_.size(); ++i) {
        std::size_t end = std::string::npos;
        char c = buffer_[i];
        if (c == '.' || c == '!' || c == '?') {
            end = i + 1;
        } else if (buffer_.compare(i, kEllipsisLen, kEllipsis) == 0) {
            end = i + kEllipsisLen;
        }
        if (end == std::string::npos) continue;
        if (end < buffer_.size() && opens_sentence_gap(buffer_[end])) {
            return end;
        }
    }
    return std::string::npos;
}

std::vector<std::string> SentenceSegmenter::feed(const std::string& chunk) {
    buffer_ += chunk;

    std::vector<std::string> sentences;
    while (true) {
        std::size_t end = find_boundary();
        if (end == std::string::npos) break;

        std::string sentence = trim(buffer_.substr(0, end));
        buffer_.erase(0, end);
        if (!sentence.empty()) {
            sentences.push_back(std::move(sentence));
        }
    }
    return sentences;
}

std::optional<std::string> SentenceSegmenter::finish() {
    std::string rest = trim(buffer_);
    buffer_.clear();
    if (rest.empty()) return std::nullopt;
    return rest;
}
