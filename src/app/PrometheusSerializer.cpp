#include "app/MetricsServer.hpp"
#include "collectors/MountstatsParser.hpp"
#include <charconv>
#include <string_view>

namespace {

using nfsgaze::model::DeltaRecord;
using nfsgaze::model::MountReport;

void append_double(std::string& out, double v) {
  char buf[32];
  auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), v);
  if (ec == std::errc{}) {
    out.append(buf, ptr);
  } else {
    out += '0';
  }
}

void append_int(std::string& out, int64_t v) {
  char buf[24];
  auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), v);
  out.append(buf, ptr);
}

void append_uint(std::string& out, uint64_t v) {
  char buf[24];
  auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), v);
  out.append(buf, ptr);
}

void append_escaped(std::string& out, std::string_view sv) {
  for (char c : sv) {
    if (c == '\\') out += "\\\\";
    else if (c == '"') out += "\\\"";
    else if (c == '\n') out += "\\n";
    else out += c;
  }
}

void emit_header(std::string& out, const char* name, const char* help, const char* type) {
  out += "# HELP ";  out += name;  out += ' ';  out += help;  out += '\n';
  out += "# TYPE ";  out += name;  out += ' ';  out += type;  out += '\n';
}

void emit_gauge_u(std::string& out, const char* name, uint64_t value) {
  out += name;  out += ' ';  append_uint(out, value);  out += '\n';
}

void emit_gauge_d(std::string& out, const char* name, double value) {
  out += name;  out += ' ';  append_double(out, value);  out += '\n';
}

// mount="...",server="..." shared by every per-mount series
void append_mount_labels(std::string& out, const MountReport& r) {
  out += "mount=\"";   append_escaped(out, r.mount.mount_point);  out += "\",";
  out += "server=\"";  append_escaped(out, r.mount.server);       out += '"';
}

void emit_mount_i(std::string& out, const char* name, const MountReport& r, int64_t value) {
  out += name;  out += '{';
  append_mount_labels(out, r);
  out += "} ";  append_int(out, value);  out += '\n';
}

// 3-label: name{mount,server,k3="v3"} value
void emit_mount_labeled_d(std::string& out, const char* name, const MountReport& r,
                          const char* k3, std::string_view v3, double value) {
  out += name;  out += '{';
  append_mount_labels(out, r);
  out += ',';  out += k3;  out += "=\"";  append_escaped(out, v3);  out += "\"} ";
  append_double(out, value);  out += '\n';
}

void emit_mount_labeled_i(std::string& out, const char* name, const MountReport& r,
                          const char* k3, std::string_view v3, int64_t value) {
  out += name;  out += '{';
  append_mount_labels(out, r);
  out += ',';  out += k3;  out += "=\"";  append_escaped(out, v3);  out += "\"} ";
  append_int(out, value);  out += '\n';
}

struct OpRateMetric {
  const char* name;
  const char* help;
  double DeltaRecord::* field;
};

constexpr OpRateMetric kOpRateMetrics[] = {
  {"nfsgaze_operation_ops_per_second", "Operations per second over the last interval", &DeltaRecord::iops},
  {"nfsgaze_operation_rtt_avg_milliseconds", "Average round trip time per operation", &DeltaRecord::avg_rtt},
  {"nfsgaze_operation_exec_avg_milliseconds", "Average execution time per operation", &DeltaRecord::avg_exec},
  {"nfsgaze_operation_queue_avg_milliseconds", "Average queue time per operation", &DeltaRecord::avg_queue},
  {"nfsgaze_operation_kilobytes_per_second", "Kilobytes transferred per second", &DeltaRecord::kb_per_sec},
};

} // anonymous namespace

namespace nfsgaze::app {

std::string snapshot_to_prometheus(const nfsgaze::model::Snapshot& s) {
  std::string out;
  out.reserve(4096);

  // ---- Poller ----
  emit_header(out, "nfsgaze_snapshot_sequence", "Published snapshot sequence number", "counter");
  emit_gauge_u(out, "nfsgaze_snapshot_sequence", s.seq);
  emit_header(out, "nfsgaze_interval_seconds", "Measured length of the last poll interval", "gauge");
  emit_gauge_d(out, "nfsgaze_interval_seconds", s.elapsed_sec);
  emit_header(out, "nfsgaze_parse_failures_total", "Mountstats reads that failed to parse", "counter");
  emit_gauge_u(out, "nfsgaze_parse_failures_total", s.parse_failures);

  if (s.mounts.empty()) return out;

  // ---- Mounts ----
  emit_header(out, "nfsgaze_mount_age_seconds", "Seconds since the filesystem was mounted", "gauge");
  for (const auto& r : s.mounts)
    emit_mount_i(out, "nfsgaze_mount_age_seconds", r, r.mount.age);
  emit_header(out, "nfsgaze_mount_bytes_read_total", "Bytes read through the mount", "counter");
  for (const auto& r : s.mounts)
    emit_mount_i(out, "nfsgaze_mount_bytes_read_total", r, r.mount.bytes_read);
  emit_header(out, "nfsgaze_mount_bytes_written_total", "Bytes written through the mount", "counter");
  for (const auto& r : s.mounts)
    emit_mount_i(out, "nfsgaze_mount_bytes_written_total", r, r.mount.bytes_write);

  // ---- Operations ----
  for (const auto& m : kOpRateMetrics) {
    emit_header(out, m.name, m.help, "gauge");
    for (const auto& r : s.mounts)
      for (const auto& d : r.deltas)
        emit_mount_labeled_d(out, m.name, r, "operation", d.operation, d.*(m.field));
  }

  emit_header(out, "nfsgaze_operation_errors", "Operation errors over the last interval", "gauge");
  for (const auto& r : s.mounts)
    for (const auto& d : r.deltas)
      emit_mount_labeled_i(out, "nfsgaze_operation_errors", r, "operation", d.operation, d.delta_errors);
  emit_header(out, "nfsgaze_operation_retransmissions", "Operation retransmissions over the last interval", "gauge");
  for (const auto& r : s.mounts)
    for (const auto& d : r.deltas)
      emit_mount_labeled_i(out, "nfsgaze_operation_retransmissions", r, "operation", d.operation, d.delta_retrans);

  // ---- VFS events ----
  bool any_events = false;
  for (const auto& r : s.mounts) any_events = any_events || r.mount.events.has_value();
  if (any_events) {
    emit_header(out, "nfsgaze_vfs_events_total", "Cumulative NFS client VFS events", "counter");
    for (const auto& r : s.mounts) {
      if (!r.mount.events) continue;
      for (const auto& [name, value] : nfsgaze::collectors::event_values(*r.mount.events))
        emit_mount_labeled_i(out, "nfsgaze_vfs_events_total", r, "event", name, value);
    }
  }

  return out;
}

} // namespace nfsgaze::app
