#pragma once

#include <cstdint>
#include <string>
#include <vector>

float rms(const std::vector<int16_t>& x);
float dbfs(const std::vector<int16_t>& x);

std::string trim(const std::string& s);
std::string join(const std::vector<std::string>& parts, const std::string& sep);

// First n characters of s, for log lines.
std::string preview(const std::string& s, std::size_t n = 60);

// Tagged console lines, safe to call from any thread.
void log_info(const std::string& tag, const std::string& msg);
void log_error(const std::string& tag, const std::string& msg);
