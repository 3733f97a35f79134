#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <optional>
#include <ostream>
#include <string>
#include <vector>
#include "app/Filter.hpp"
#include "app/SnapshotBuffers.hpp"
#include "collectors/MountstatsCollector.hpp"
#include "model/Mount.hpp"

namespace nfsgaze::app {

struct MonitorOptions {
  std::string mount_point;                 // empty = every NFS mount
  std::chrono::milliseconds interval{1000};
  int count{0};                            // reports to print, 0 = until stopped
  bool show_bandwidth{false};
  bool show_attr{false};
  bool clear_screen{false};
  bool iostat{false};
  OperationFilterSpec filter;
};

// Mount points to report on, sorted. nullopt when `mount_point` is set
// but not present in `mounts`.
[[nodiscard]] std::optional<std::vector<std::string>>
select_mounts(const nfsgaze::model::MountMap& mounts, const std::string& mount_point);

// Poll loop. Owns the previous snapshot; nothing else touches it.
class Monitor {
public:
  Monitor(nfsgaze::collectors::MountstatsCollector& collector, MonitorOptions opts,
          SnapshotBuffers* buffers = nullptr);

  // Returns the process exit status: 0 after a clean stop, 1 when the
  // first read fails, finds no NFS mounts or misses the requested mount.
  int run(const std::atomic<bool>& stop, std::ostream& os);

  // Since-mount report (nfsiostat mode) or the banner, for the first snapshot
  void print_initial_summary(std::ostream& os) const;

  // One interval: diff `current` against the held snapshot, render, publish,
  // then keep `current` as the new baseline.
  void step(nfsgaze::model::MountMap current, double elapsed_sec, std::time_t now, std::ostream& os);

  void set_baseline(nfsgaze::model::MountMap mounts) { previous_ = std::move(mounts); }

  [[nodiscard]] uint64_t parse_failures() const { return parse_failures_; }
  [[nodiscard]] int reports() const { return reports_; }

private:
  bool sleep_interval(const std::atomic<bool>& stop) const;

  nfsgaze::collectors::MountstatsCollector& collector_;
  MonitorOptions opts_;
  OperationFilter filter_;
  SnapshotBuffers* buffers_;
  nfsgaze::model::MountMap previous_;
  uint64_t parse_failures_{0};
  int reports_{0};
};

} // namespace nfsgaze::app
