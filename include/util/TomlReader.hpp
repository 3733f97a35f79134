#pragma once

#include <cctype>
#include <charconv>
#include <fstream>
#include <map>
#include <string>
#include <string_view>

namespace nfsgaze::util {

// Flat [section] key = value reader, enough TOML for a config file:
// comments, quoted strings, integers and booleans. Arrays and inline
// tables are not understood. Keys before the first header live in "".
class TomlReader {
public:
  bool load(const std::string& path) {
    values_.clear();
    std::ifstream in(path);
    if (!in.is_open()) return false;
    std::string section;
    std::string raw;
    while (std::getline(in, raw)) {
      auto line = trim(strip_comment(raw));
      if (line.empty()) continue;
      if (line.front() == '[') {
        if (line.back() == ']') section = std::string(trim(line.substr(1, line.size() - 2)));
        continue;
      }
      auto eq = line.find('=');
      if (eq == std::string_view::npos) continue;
      auto key = trim(line.substr(0, eq));
      auto val = trim(line.substr(eq + 1));
      if (val.size() >= 2 && val.front() == '"' && val.back() == '"') val = val.substr(1, val.size() - 2);
      values_[qualified(section, key)] = std::string(val);
    }
    return true;
  }

  [[nodiscard]] bool has(std::string_view section, std::string_view key) const {
    return values_.contains(qualified(section, key));
  }

  [[nodiscard]] std::string get_string(std::string_view section, std::string_view key,
                                       const std::string& def = "") const {
    auto it = values_.find(qualified(section, key));
    return it == values_.end() ? def : it->second;
  }

  [[nodiscard]] int get_int(std::string_view section, std::string_view key, int def = 0) const {
    auto it = values_.find(qualified(section, key));
    if (it == values_.end()) return def;
    const std::string& v = it->second;
    int out = 0;
    auto [ptr, ec] = std::from_chars(v.data(), v.data() + v.size(), out);
    if (v.empty() || ec != std::errc{} || ptr != v.data() + v.size()) return def;
    return out;
  }

  // true/false in any of the usual spellings, or 1/0
  [[nodiscard]] bool get_bool(std::string_view section, std::string_view key, bool def = false) const {
    auto it = values_.find(qualified(section, key));
    if (it == values_.end()) return def;
    std::string v = it->second;
    for (auto& c : v) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (v == "true" || v == "1") return true;
    if (v == "false" || v == "0") return false;
    return def;
  }

private:
  // section and key joined by a byte that cannot appear in either
  static std::string qualified(std::string_view section, std::string_view key) {
    std::string k(section);
    k += '\x1f';
    k += key;
    return k;
  }

  // '#' outside a quoted string starts a comment
  static std::string_view strip_comment(std::string_view sv) {
    bool quoted = false;
    for (size_t i = 0; i < sv.size(); ++i) {
      if (sv[i] == '"') quoted = !quoted;
      else if (sv[i] == '#' && !quoted) return sv.substr(0, i);
    }
    return sv;
  }

  static std::string_view trim(std::string_view sv) {
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front()))) sv.remove_prefix(1);
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back()))) sv.remove_suffix(1);
    return sv;
  }

  std::map<std::string, std::string> values_;
};

} // namespace nfsgaze::util
