#include "app/Options.hpp"
#include <charconv>
#include <string_view>

namespace nfsgaze::app {

namespace {

int parse_number(std::string_view flag, std::string_view val, int min, int max) {
  int out = 0;
  auto [ptr, ec] = std::from_chars(val.data(), val.data() + val.size(), out);
  if (val.empty() || ec != std::errc{} || ptr != val.data() + val.size() || out < min || out > max) {
    throw UsageError("invalid value for " + std::string(flag) + ": '" + std::string(val) + "'");
  }
  return out;
}

} // namespace

Options parse_args(int argc, const char* const* argv) {
  Options o{};

  // --config has to be known before anything else is resolved
  for (int i = 1; i < argc; ++i) {
    std::string_view a = argv[i];
    if (a == "--config") {
      if (i + 1 >= argc) throw UsageError("--config requires a value");
      o.config_path = argv[++i];
    }
  }
  if (o.config_path.empty()) o.config_path = ui::config_file_path();
  o.cfg = ui::load_config(o.config_path);

  auto value = [&](int& i, std::string_view flag) -> std::string_view {
    if (i + 1 >= argc) throw UsageError(std::string(flag) + " requires a value");
    return argv[++i];
  };

  for (int i = 1; i < argc; ++i) {
    std::string_view a = argv[i];
    if (a == "-m" || a == "--mount") o.mount_point = value(i, a);
    else if (a == "--ops") o.cfg.monitor.ops = value(i, a);
    else if (a == "-i" || a == "--interval") o.cfg.monitor.interval_sec = parse_number(a, value(i, a), 1, 86400);
    else if (a == "-c" || a == "--count") o.cfg.monitor.count = parse_number(a, value(i, a), 0, 1 << 30);
    else if (a == "-f" || a == "--file") o.cfg.monitor.mountstats_path = value(i, a);
    else if (a == "--metrics-port") o.cfg.metrics.port = parse_number(a, value(i, a), 0, 65535);
    else if (a == "--config") ++i; // consumed above
    else if (a == "--attr") o.cfg.display.attr = true;
    else if (a == "--bw") o.cfg.display.bandwidth = true;
    else if (a == "--clear") o.cfg.display.clear = true;
    else if (a == "--nfsiostat") o.cfg.display.iostat = true;
    else if (a == "-h" || a == "--help") o.help = true;
    else if (a.starts_with("-")) throw UsageError("unknown option: " + std::string(a));
    else if (o.mount_point.empty()) o.mount_point = a;
    else throw UsageError("unexpected argument: " + std::string(a));
  }
  return o;
}

std::string usage_text(const char* prog) {
  std::string p = prog ? prog : "nfsgaze";
  return "NFS I/O Statistics Monitor\n\n"
         "Usage: " + p + " [options] [MOUNT]\n\n"
         "Options:\n"
         "  -m, --mount PATH      mount point to monitor (default: all NFS mounts)\n"
         "      --ops LIST        comma-separated operations to show, e.g. READ,WRITE\n"
         "  -i, --interval SEC    update interval in seconds (default 1)\n"
         "  -c, --count N         number of reports, 0 = until interrupted\n"
         "      --bw              show bandwidth columns\n"
         "      --attr            show attribute cache events (nfsiostat format)\n"
         "      --nfsiostat       nfsiostat-style output\n"
         "      --clear           clear the screen between reports\n"
         "  -f, --file PATH       mountstats file (default /proc/self/mountstats)\n"
         "      --metrics-port N  serve Prometheus metrics on port N\n"
         "      --config PATH     TOML config file\n"
         "  -h, --help            show this help\n\n"
         "Examples:\n"
         "  " + p + " /mnt/nfs --nfsiostat --attr\n"
         "  " + p + " -m /mnt/nfs --ops READ,WRITE --bw\n";
}

} // namespace nfsgaze::app
