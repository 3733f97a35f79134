#pragma once

#include <cstdint>
#include <ctime>
#include <string>

namespace nfsgaze::ui {

// Table cell values
std::string format_duration(int64_t ms);      // 0 -> "0.0ms", else ms/1000 to one decimal
std::string format_rate(double rate);         // one decimal
std::string format_bandwidth(double kb_per_sec); // KB/s -> MB/s, one decimal

// printf-style fixed point, right aligned in `width` columns
std::string fixed(double v, int width, int precision);

// Alignment without truncation; longer strings pass through
std::string pad_right(const std::string& s, int w);
std::string pad_left(const std::string& s, int w);

std::string ascii_lower(std::string s);

// "2024-01-01 12:00:00 UTC"
std::string format_timestamp_utc(std::time_t t);

} // namespace nfsgaze::ui
