#include "utils.hpp"

#include <cmath>
#include <iostream>
#include <mutex>

namespace {

std::mutex& log_mutex() {
    static std::mutex m;
    return m;
}

} // namespace

float rms(const std::vector<int16_t>& x) {
    if (x.empty()) return 0.0f;
    double acc = 0.0;
    for (auto sample : x) {
        acc += static_cast<double>(sample) * static_cast<double>(sample);
    }
    double mean = acc / static_cast<double>(x.size());
    return static_cast<float>(std::sqrt(mean));
}

float dbfs(const std::vector<int16_t>& x) {
    const float r = rms(x);
    const float ref = 32768.0f; // int16 max magnitude
    return 20.0f * std::log10((r + 1e-9f) / ref);
}

std::string trim(const std::string& s) {
    std::size_t start = s.find_first_not_of(" \t\n\r");
    std::size_t end = s.find_last_not_of(" \t\n\r");
    if (start == std::string::npos || end == std::string::npos) return {};
    return s.substr(start, end - start + 1);
}

std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += sep;
        out += parts[i];
    }
    return out;
}

std::string preview(const std::string& s, std::size_t n) {
    if (s.size() <= n) return s;
    return s.substr(0, n) + "...";
}

void log_info(const std::string& tag, const std::string& msg) {
    std::lock_guard<std::mutex> lock(log_mutex());
    std::cout << "[" << tag << "] " << msg << "\n";
}

void log_error(const std::string& tag, const std::string& msg) {
    std::lock_guard<std::mutex> lock(log_mutex());
    std::cerr << "[" << tag << "] " << msg << "\n";
}
