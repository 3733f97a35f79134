#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>

namespace nfsgaze::model {

// Cumulative counters for one RPC operation on one mount.
// Time fields are in the report's native unit (milliseconds).
struct OperationCounters {
  std::string name;
  int64_t ops{};
  int64_t ntrans{};       // ops + retransmits
  int64_t timeouts{};
  int64_t bytes_sent{};
  int64_t bytes_recv{};
  int64_t queue_time{};
  int64_t rtt{};
  int64_t execute_time{};
  int64_t errors{};       // optional 9th column, 0 on older kernels

  bool operator==(const OperationCounters&) const = default;
};

// The per-mount "events:" line, in report order.
struct EventCounters {
  int64_t inode_revalidate{};
  int64_t dentry_revalidate{};
  int64_t data_invalidate{};
  int64_t attr_invalidate{};
  int64_t vfs_open{};
  int64_t vfs_lookup{};
  int64_t vfs_access{};
  int64_t vfs_update_page{};
  int64_t vfs_read_page{};
  int64_t vfs_read_pages{};
  int64_t vfs_write_page{};
  int64_t vfs_write_pages{};
  int64_t vfs_getdents{};
  int64_t vfs_setattr{};
  int64_t vfs_flush{};
  int64_t vfs_fsync{};
  int64_t vfs_lock{};
  int64_t vfs_release{};
  int64_t congestion_wait{};
  int64_t setattr_trunc{};
  int64_t extend_write{};
  int64_t silly_rename{};
  int64_t short_read{};
  int64_t short_write{};
  int64_t delay{};
  // pNFS, newer statvers only
  int64_t pnfs_read{};
  int64_t pnfs_write{};

  bool operator==(const EventCounters&) const = default;
};

struct MountSnapshot {
  std::string device;       // server:/export
  std::string mount_point;  // e.g., /mnt/nfs
  std::string server;
  std::string export_path;  // "/" when the device has no colon
  int64_t age{};            // seconds since mount
  std::unordered_map<std::string, OperationCounters> operations;
  std::optional<EventCounters> events; // absent when no events: line
  int64_t bytes_read{};
  int64_t bytes_write{};

  bool operator==(const MountSnapshot&) const = default;
};

// Keyed by mount point
using MountMap = std::unordered_map<std::string, MountSnapshot>;

} // namespace nfsgaze::model
