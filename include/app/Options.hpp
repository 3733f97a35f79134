#pragma once

#include <stdexcept>
#include <string>
#include "ui/Config.hpp"

namespace nfsgaze::app {

// Bad flag, missing value or unparsable number on the command line
class UsageError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

struct Options {
  ui::Config cfg;
  std::string mount_point;   // empty = every NFS mount
  std::string config_path;   // the TOML file actually consulted
  bool help{false};
};

// Flags override the config file, which overrides the environment.
// Throws UsageError.
Options parse_args(int argc, const char* const* argv);

std::string usage_text(const char* prog);

} // namespace nfsgaze::app
