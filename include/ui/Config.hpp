#pragma once

#include <string>

namespace nfsgaze::ui {

// Settings with a TOML key and an environment variable behind them.
// Command-line flags are layered on top by app::parse_args.
struct Config {
  struct {
    std::string mountstats_path;
    int interval_sec{1};
    int count{0};           // 0 = until interrupted
    std::string ops;        // comma-separated, empty = all
  } monitor;

  struct {
    bool bandwidth{false};
    bool attr{false};
    bool clear{false};
    bool iostat{false};
  } display;

  struct {
    int port{0};            // 0 = disabled
  } metrics;
};

// Resolve every setting from TOML -> env -> compiled default.
// An empty or unreadable path skips the TOML layer.
Config load_config(const std::string& toml_path);

// $XDG_CONFIG_HOME/nfsgaze/config.toml, else ~/.config/nfsgaze/config.toml
std::string config_file_path();

// Environment variable helpers
const char* getenv_compat(const char* name);
int getenv_int(const char* name, int defv);

} // namespace nfsgaze::ui
