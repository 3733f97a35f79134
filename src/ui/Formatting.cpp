#include "ui/Formatting.hpp"
#include <cctype>
#include <cstdio>

namespace nfsgaze::ui {

std::string format_duration(int64_t ms) {
  if (ms == 0) return "0.0ms";
  char buf[48];
  std::snprintf(buf, sizeof(buf), "%.1fms", static_cast<double>(ms) / 1000.0);
  return buf;
}

std::string format_rate(double rate) {
  if (rate == 0.0) return "0.0";
  char buf[48];
  std::snprintf(buf, sizeof(buf), "%.1f", rate);
  return buf;
}

std::string format_bandwidth(double kb_per_sec) {
  return format_rate(kb_per_sec / 1024.0);
}

std::string fixed(double v, int width, int precision) {
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%*.*f", width, precision, v);
  return buf;
}

std::string pad_right(const std::string& s, int w) {
  if (static_cast<int>(s.size()) >= w) return s;
  return s + std::string(w - s.size(), ' ');
}

std::string pad_left(const std::string& s, int w) {
  if (static_cast<int>(s.size()) >= w) return s;
  return std::string(w - s.size(), ' ') + s;
}

std::string ascii_lower(std::string s) {
  for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

std::string format_timestamp_utc(std::time_t t) {
  std::tm ut{};
  gmtime_r(&t, &ut);
  char buf[64];
  if (std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S UTC", &ut) == 0) return std::string();
  return std::string(buf);
}

} // namespace nfsgaze::ui
