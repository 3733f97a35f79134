#pragma once
#include <cstdint>
#include <string>

namespace nfsgaze::model {

// Per-operation activity between two snapshots of one mount.
// Raw deltas are signed: a remount shows up as a negative value.
struct DeltaRecord {
  std::string operation;
  int64_t delta_ops{};
  int64_t delta_bytes{};   // sent + recv
  int64_t delta_sent{};
  int64_t delta_recv{};
  int64_t delta_rtt{};
  int64_t delta_exec{};
  int64_t delta_queue{};
  int64_t delta_errors{};
  int64_t delta_retrans{}; // timeouts

  // calculated
  double iops{};
  double avg_rtt{};        // ms per op
  double avg_exec{};
  double avg_queue{};
  double kb_per_op{};
  double kb_per_sec{};
};

} // namespace nfsgaze::model
