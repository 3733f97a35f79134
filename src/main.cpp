#include "app/MetricsServer.hpp"
#include "app/Monitor.hpp"
#include "app/Options.hpp"
#include "app/SnapshotBuffers.hpp"
#include "collectors/MountstatsCollector.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <iostream>
#include <memory>
#include <string>

static std::atomic<bool> g_stop{false};
static void on_signal(int){ g_stop.store(true); }

int main(int argc, char** argv) {
  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);

  nfsgaze::app::Options opts;
  try {
    opts = nfsgaze::app::parse_args(argc, argv);
  } catch (const nfsgaze::app::UsageError& e) {
    std::fprintf(stderr, "nfsgaze: %s\n", e.what());
    std::fprintf(stderr, "Try '%s --help'.\n", argv[0]);
    return 2;
  }
  if (opts.help) {
    std::cout << nfsgaze::app::usage_text(argv[0]);
    return 0;
  }

  const auto& cfg = opts.cfg;
  nfsgaze::app::MonitorOptions mo{};
  mo.mount_point = opts.mount_point;
  mo.interval = std::chrono::seconds(cfg.monitor.interval_sec);
  mo.count = cfg.monitor.count;
  mo.show_bandwidth = cfg.display.bandwidth;
  mo.show_attr = cfg.display.attr;
  mo.clear_screen = cfg.display.clear;
  mo.iostat = cfg.display.iostat;
  mo.filter.names = nfsgaze::app::parse_operations_list(cfg.monitor.ops);

  nfsgaze::app::SnapshotBuffers buffers;
  std::unique_ptr<nfsgaze::app::MetricsServer> metrics;
  if (cfg.metrics.port > 0) {
    metrics = std::make_unique<nfsgaze::app::MetricsServer>(buffers, static_cast<uint16_t>(cfg.metrics.port));
    metrics->start();
  }

  nfsgaze::collectors::MountstatsCollector collector(cfg.monitor.mountstats_path);
  nfsgaze::app::Monitor monitor(collector, std::move(mo), metrics ? &buffers : nullptr);
  int rc = monitor.run(g_stop, std::cout);

  if (metrics) metrics->stop();
  return rc;
}
