#include "ui/Renderer.hpp"
#include "ui/Formatting.hpp"
#include <cstdio>
#include <iterator>
#include <string>

namespace nfsgaze::ui {

namespace {

constexpr int kOpCol = 12;
constexpr int kNumCol = 8;
constexpr int kIostatCol = 16;

std::string percent_of(int64_t part, int64_t whole) {
  double pct = whole > 0 ? static_cast<double>(part) / static_cast<double>(whole) * 100.0 : 0.0;
  char buf[32];
  std::snprintf(buf, sizeof(buf), "(%.1f%%)", pct);
  return buf;
}

void simple_row(std::ostream& os, const std::string& op, const std::string* cols, int n) {
  os << pad_right(op, kOpCol);
  for (int i = 0; i < n; ++i) os << ' ' << pad_left(cols[i], kNumCol);
  os << '\n';
}

} // namespace

void render_simple(std::ostream& os,
                   const nfsgaze::model::MountSnapshot& mount,
                   const std::vector<nfsgaze::model::DeltaRecord>& records,
                   bool show_bandwidth,
                   std::time_t now) {
  if (records.empty()) return;

  os << mount.device << " mounted on " << mount.mount_point << '\n';
  os << "Timestamp: " << format_timestamp_utc(now) << '\n';
  os << '\n';

  if (show_bandwidth) {
    const std::string hdr[] = {"IOPS", "RTT(ms)", "EXE(ms)", "MB/s", "KB/op", "ERRORS"};
    simple_row(os, "OP", hdr, 6);
    os << std::string(72, '-') << '\n';
  } else {
    const std::string hdr[] = {"IOPS", "RTT(ms)", "EXE(ms)", "ERRORS"};
    simple_row(os, "OP", hdr, 4);
    os << std::string(48, '-') << '\n';
  }

  for (const auto& r : records) {
    // averages are shown truncated to whole report units
    auto rtt = format_duration(static_cast<int64_t>(r.avg_rtt));
    auto exe = format_duration(static_cast<int64_t>(r.avg_exec));
    if (show_bandwidth) {
      const std::string cols[] = {format_rate(r.iops), rtt, exe, format_bandwidth(r.kb_per_sec),
                                  format_rate(r.kb_per_op), std::to_string(r.delta_errors)};
      simple_row(os, r.operation, cols, 6);
    } else {
      const std::string cols[] = {format_rate(r.iops), rtt, exe, std::to_string(r.delta_errors)};
      simple_row(os, r.operation, cols, 4);
    }
  }

  os << '\n';
}

void render_iostat(std::ostream& os,
                   const nfsgaze::model::MountSnapshot& mount,
                   const std::vector<nfsgaze::model::DeltaRecord>& records,
                   const nfsgaze::model::MountSnapshot* previous,
                   bool show_attr) {
  double total_ops = 0.0;
  for (const auto& r : records) total_ops += r.iops;

  os << '\n' << mount.device << " mounted on " << mount.mount_point << ":\n\n";
  os << pad_left("ops/s", kIostatCol) << ' ' << pad_left("rpc bklog", kIostatCol) << '\n';
  os << fixed(total_ops, kIostatCol, 3) << ' ' << fixed(0.0, kIostatCol, 3) << "\n\n";

  for (const auto& r : records) {
    os << ascii_lower(r.operation) << ':';
    const char* hdr[] = {"ops/s", "kB/s", "kB/op", "retrans", "avg RTT (ms)",
                         "avg exe (ms)", "avg queue (ms)", "errors"};
    for (size_t i = 0; i < std::size(hdr); ++i) {
      if (i) os << ' ';
      os << pad_left(hdr[i], kIostatCol);
    }
    os << '\n';

    os << fixed(r.iops, 26, 3) << ' '
       << fixed(r.kb_per_sec, kIostatCol, 3) << ' '
       << fixed(r.kb_per_op, kIostatCol, 3) << ' '
       << pad_left(std::to_string(r.delta_retrans), 8) << ' ' << percent_of(r.delta_retrans, r.delta_ops) << ' '
       << fixed(r.avg_rtt, kIostatCol, 3) << ' '
       << fixed(r.avg_exec, kIostatCol, 3) << ' '
       << fixed(r.avg_queue, kIostatCol, 3) << ' '
       << pad_left(std::to_string(r.delta_errors), 8) << ' ' << percent_of(r.delta_errors, r.delta_ops) << '\n';
  }

  if (show_attr && previous && mount.events && previous->events) {
    const auto& cur = *mount.events;
    const auto& old = *previous->events;
    os << '\n';
    os << (cur.vfs_open - old.vfs_open) << " VFS opens\n";
    os << (cur.inode_revalidate - old.inode_revalidate) << " inoderevalidates (forced GETATTRs)\n";
    os << (cur.data_invalidate - old.data_invalidate) << " page cache invalidations\n";
    os << (cur.attr_invalidate - old.attr_invalidate) << " attribute cache invalidations\n";
  }
}

void render_summary(std::ostream& os,
                    const std::string& selected_mount,
                    const std::vector<const nfsgaze::model::MountSnapshot*>& mounts,
                    const std::vector<std::string>& operations) {
  os << "NFS I/O Statistics Monitor\n";
  os << "==========================\n\n";

  if (!selected_mount.empty()) {
    os << "Monitoring mount point: " << selected_mount << '\n';
  } else {
    os << "Monitoring " << mounts.size() << " NFS mount(s):\n";
    for (const auto* m : mounts) os << "  " << m->device << " -> " << m->mount_point << '\n';
  }

  if (!operations.empty()) {
    os << "Filtering operations: ";
    for (size_t i = 0; i < operations.size(); ++i) {
      if (i) os << ", ";
      os << operations[i];
    }
    os << '\n';
  }
  os << '\n';
}

void clear_screen(std::ostream& os) {
  os << "\x1B[2J\x1B[1;1H";
}

} // namespace nfsgaze::ui
