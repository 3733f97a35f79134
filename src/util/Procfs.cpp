#include "util/Procfs.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace nfsgaze::util {

static std::string proc_root() {
  const char* env = std::getenv("NFSGAZE_PROC_ROOT");
  if (env && *env) return std::string(env);
  return std::string();
}

auto map_proc_path(const std::string& abs) -> std::string {
  if (abs.rfind("/proc", 0) != 0) return abs; // not under /proc
  auto root = proc_root();
  if (root.empty()) return abs;
  std::filesystem::path p(root);
  p /= std::filesystem::path(abs.substr(1)); // drop leading '/'
  return p.string();
}

auto read_file_string(const std::string& abs) -> std::optional<std::string> {
  std::ifstream in(map_proc_path(abs));
  if (!in) return std::nullopt;
  if (in.peek() == std::ifstream::traits_type::eof()) return std::string();
  std::ostringstream ss;
  ss << in.rdbuf();
  // mountstats can vanish mid-read when the last NFS mount goes away
  if (in.bad() || ss.fail()) return std::nullopt;
  return ss.str();
}

} // namespace nfsgaze::util
