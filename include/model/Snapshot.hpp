#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include "model/Mount.hpp"
#include "model/Delta.hpp"

namespace nfsgaze::model {

// One monitored mount as of the latest poll
struct MountReport {
  MountSnapshot mount;
  std::vector<DeltaRecord> deltas; // filtered, sorted by operation
};

// What the poll loop publishes for readers outside its thread
struct Snapshot {
  uint64_t seq{};
  double elapsed_sec{};
  std::vector<MountReport> mounts;
  uint64_t parse_failures{}; // cumulative, since start
};

} // namespace nfsgaze::model
