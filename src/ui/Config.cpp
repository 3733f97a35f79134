#include "ui/Config.hpp"
#include "collectors/MountstatsCollector.hpp"
#include "util/TomlReader.hpp"
#include <charconv>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <string_view>

namespace nfsgaze::ui {

const char* getenv_compat(const char* name) {
  const char* v = std::getenv(name);
  if (v && *v) return v;
  // Accept both NFSGAZE_ and nfsgaze_ prefixes
  std::string alt;
  std::string n(name);
  if (n.rfind("NFSGAZE_", 0) == 0) {
    alt = std::string("nfsgaze_") + n.substr(8);
  } else if (n.rfind("nfsgaze_", 0) == 0) {
    alt = std::string("NFSGAZE_") + n.substr(8);
  }
  if (!alt.empty()) {
    v = std::getenv(alt.c_str());
    if (v && *v) return v;
  }
  return nullptr;
}

int getenv_int(const char* name, int defv) {
  const char* v = getenv_compat(name);
  if (!v || !*v) return defv;
  std::string_view sv(v);
  int out = 0;
  auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), out);
  if (ec != std::errc{} || ptr != sv.data() + sv.size()) return defv;
  return out;
}

static bool env_flag(const char* name, bool defv) {
  const char* v = getenv_compat(name);
  if (!v) return defv;
  if (v[0]=='0'||v[0]=='f'||v[0]=='F'||v[0]=='n'||v[0]=='N') return false;
  return true;
}

std::string config_file_path() {
  if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
    return std::string(xdg) + "/nfsgaze/config.toml";
  if (const char* home = std::getenv("HOME"); home && *home)
    return std::string(home) + "/.config/nfsgaze/config.toml";
  return {};
}

// Resolve an int from TOML -> env -> compiled default
static int resolve_int(const nfsgaze::util::TomlReader& toml, bool have_toml,
                       const char* section, const char* key,
                       const char* env_name, int def) {
  if (have_toml && toml.has(section, key))
    return toml.get_int(section, key, def);
  if (env_name)
    return getenv_int(env_name, def);
  return def;
}

// Resolve a bool from TOML -> env -> compiled default
static bool resolve_bool(const nfsgaze::util::TomlReader& toml, bool have_toml,
                         const char* section, const char* key,
                         const char* env_name, bool def) {
  if (have_toml && toml.has(section, key))
    return toml.get_bool(section, key, def);
  if (env_name)
    return env_flag(env_name, def);
  return def;
}

// Resolve a string from TOML -> env -> compiled default
static std::string resolve_string(const nfsgaze::util::TomlReader& toml, bool have_toml,
                                  const char* section, const char* key,
                                  const char* env_name, const std::string& def) {
  if (have_toml && toml.has(section, key))
    return toml.get_string(section, key, def);
  if (env_name) {
    const char* v = getenv_compat(env_name);
    if (v && *v) return std::string(v);
  }
  return def;
}

Config load_config(const std::string& toml_path) {
  Config c{};
  nfsgaze::util::TomlReader toml;
  bool have_toml = !toml_path.empty() && toml.load(toml_path);

  // --- [monitor] ---
  c.monitor.mountstats_path = resolve_string(toml, have_toml, "monitor", "mountstats_path", "NFSGAZE_MOUNTSTATS_PATH",
                                             std::string(nfsgaze::collectors::kDefaultMountstatsPath));
  c.monitor.interval_sec    = resolve_int(toml, have_toml, "monitor", "interval_sec", "NFSGAZE_INTERVAL_SEC", 1);
  c.monitor.count           = resolve_int(toml, have_toml, "monitor", "count",        "NFSGAZE_COUNT", 0);
  c.monitor.ops             = resolve_string(toml, have_toml, "monitor", "ops",       "NFSGAZE_OPS", "");

  // --- [display] ---
  c.display.bandwidth = resolve_bool(toml, have_toml, "display", "bandwidth", "NFSGAZE_SHOW_BW", false);
  c.display.attr      = resolve_bool(toml, have_toml, "display", "attr",      "NFSGAZE_SHOW_ATTR", false);
  c.display.clear     = resolve_bool(toml, have_toml, "display", "clear",     "NFSGAZE_CLEAR", false);
  c.display.iostat    = resolve_bool(toml, have_toml, "display", "iostat",    "NFSGAZE_IOSTAT", false);

  // --- [metrics] ---
  c.metrics.port = resolve_int(toml, have_toml, "metrics", "port", "NFSGAZE_METRICS_PORT", 0);

  if (c.monitor.interval_sec < 1 || c.monitor.interval_sec > 86400) {
    int fixed = c.monitor.interval_sec < 1 ? 1 : 86400;
    std::fprintf(stderr, "nfsgaze: config: interval_sec %d out of range, using %d\n", c.monitor.interval_sec, fixed);
    c.monitor.interval_sec = fixed;
  }
  if (c.monitor.count < 0) c.monitor.count = 0;
  if (c.metrics.port < 0 || c.metrics.port > 65535) {
    std::fprintf(stderr, "nfsgaze: config: metrics port %d out of range, disabled\n", c.metrics.port);
    c.metrics.port = 0;
  }

  return c;
}

} // namespace nfsgaze::ui
