#include "app/DeltaEngine.hpp"
#include <algorithm>
#include <cstdint>
#include <limits>

namespace nfsgaze::app {

using nfsgaze::model::DeltaRecord;
using nfsgaze::model::MountSnapshot;
using nfsgaze::model::OperationCounters;

namespace {

// Counters come straight from text and may be anything an int64 holds;
// differences clamp to the int64 range instead of wrapping.
int64_t saturate(bool overflowed, int64_t v, bool toward_max) {
  if (!overflowed) return v;
  return toward_max ? std::numeric_limits<int64_t>::max() : std::numeric_limits<int64_t>::min();
}

int64_t counter_diff(int64_t cur, int64_t prev) {
  int64_t out = 0;
  bool ov = __builtin_sub_overflow(cur, prev, &out);
  return saturate(ov, out, cur > prev);
}

int64_t counter_sum(int64_t a, int64_t b) {
  int64_t out = 0;
  bool ov = __builtin_add_overflow(a, b, &out);
  return saturate(ov, out, a > 0);
}

} // namespace

DeltaRecord operation_delta(const OperationCounters& p, const OperationCounters& c,
                            double elapsed_seconds) {
  DeltaRecord d;
  d.operation = c.name;
  d.delta_ops = counter_diff(c.ops, p.ops);
  d.delta_sent = counter_diff(c.bytes_sent, p.bytes_sent);
  d.delta_recv = counter_diff(c.bytes_recv, p.bytes_recv);
  d.delta_bytes = counter_sum(d.delta_sent, d.delta_recv);
  d.delta_rtt = counter_diff(c.rtt, p.rtt);
  d.delta_exec = counter_diff(c.execute_time, p.execute_time);
  d.delta_queue = counter_diff(c.queue_time, p.queue_time);
  d.delta_errors = counter_diff(c.errors, p.errors);
  d.delta_retrans = counter_diff(c.timeouts, p.timeouts);

  const double ops = static_cast<double>(d.delta_ops);
  const double kb = static_cast<double>(d.delta_bytes) / 1024.0;
  if (elapsed_seconds > 0.0) {
    d.iops = ops / elapsed_seconds;
    d.kb_per_sec = kb / elapsed_seconds;
  }
  // per-op averages only make sense for new activity
  if (d.delta_ops > 0) {
    d.avg_rtt = static_cast<double>(d.delta_rtt) / ops;
    d.avg_exec = static_cast<double>(d.delta_exec) / ops;
    d.avg_queue = static_cast<double>(d.delta_queue) / ops;
    d.kb_per_op = kb / ops;
  }
  return d;
}

std::vector<DeltaRecord> compute_deltas(const MountSnapshot& previous, const MountSnapshot& current,
                                        double elapsed_seconds) {
  std::vector<DeltaRecord> out;
  out.reserve(current.operations.size());
  for (const auto& [name, cur] : current.operations) {
    OperationCounters zero{};
    zero.name = name;
    auto it = previous.operations.find(name);
    const OperationCounters& prev = (it != previous.operations.end()) ? it->second : zero;
    auto d = operation_delta(prev, cur, elapsed_seconds);
    d.operation = name;
    if (d.delta_ops > 0) out.push_back(std::move(d));
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b){ return a.operation < b.operation; });
  return out;
}

std::vector<DeltaRecord> cumulative_deltas(const MountSnapshot& mount) {
  MountSnapshot empty{};
  return compute_deltas(empty, mount, static_cast<double>(mount.age));
}

} // namespace nfsgaze::app
