#pragma once
#include <string>
#include "model/Mount.hpp"

namespace nfsgaze::collectors {

inline constexpr const char* kDefaultMountstatsPath = "/proc/self/mountstats";

class MountstatsCollector {
public:
  explicit MountstatsCollector(std::string path = kDefaultMountstatsPath);

  // Read and parse the report. On failure `out` is left untouched,
  // the reason is logged and kept in last_error().
  bool sample(nfsgaze::model::MountMap& out);

  [[nodiscard]] const std::string& path() const { return path_; }
  [[nodiscard]] const std::string& last_error() const { return last_error_; }

private:
  std::string path_;
  std::string last_error_;
};

} // namespace nfsgaze::collectors
