#include "collectors/MountstatsParser.hpp"
#include "util/Procfs.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <iterator>
#include <system_error>

namespace nfsgaze::collectors {

namespace {

using Kind = MountstatsError::Kind;

constexpr std::string_view kDeviceTag = "device";
constexpr std::string_view kOnSep = " on ";

// Section headers inside a mount block that carry a colon but are not per-op lines
constexpr std::string_view kReservedPrefixes[] = {
  "RPC", "xprt", "per-op", "opts", "caps", "sec", "nfsv4", "nfsv3"
};

constexpr size_t kMinEventValues = 25;
constexpr size_t kMinOpValues = 8;
constexpr size_t kMinBytesTokens = 6;

struct EventField { const char* name; int64_t model::EventCounters::* field; };

// Report order; index == position on the events: line
constexpr EventField kEventFields[] = {
  {"InodeRevalidate",  &model::EventCounters::inode_revalidate},
  {"DentryRevalidate", &model::EventCounters::dentry_revalidate},
  {"DataInvalidate",   &model::EventCounters::data_invalidate},
  {"AttrInvalidate",   &model::EventCounters::attr_invalidate},
  {"VFSOpen",          &model::EventCounters::vfs_open},
  {"VFSLookup",        &model::EventCounters::vfs_lookup},
  {"VFSAccess",        &model::EventCounters::vfs_access},
  {"VFSUpdatePage",    &model::EventCounters::vfs_update_page},
  {"VFSReadPage",      &model::EventCounters::vfs_read_page},
  {"VFSReadPages",     &model::EventCounters::vfs_read_pages},
  {"VFSWritePage",     &model::EventCounters::vfs_write_page},
  {"VFSWritePages",    &model::EventCounters::vfs_write_pages},
  {"VFSGetdents",      &model::EventCounters::vfs_getdents},
  {"VFSSetattr",       &model::EventCounters::vfs_setattr},
  {"VFSFlush",         &model::EventCounters::vfs_flush},
  {"VFSFsync",         &model::EventCounters::vfs_fsync},
  {"VFSLock",          &model::EventCounters::vfs_lock},
  {"VFSRelease",       &model::EventCounters::vfs_release},
  {"CongestionWait",   &model::EventCounters::congestion_wait},
  {"SetattrTrunc",     &model::EventCounters::setattr_trunc},
  {"ExtendWrite",      &model::EventCounters::extend_write},
  {"SillyRename",      &model::EventCounters::silly_rename},
  {"ShortRead",        &model::EventCounters::short_read},
  {"ShortWrite",       &model::EventCounters::short_write},
  {"Delay",            &model::EventCounters::delay},
  {"PNFSRead",         &model::EventCounters::pnfs_read},
  {"PNFSWrite",        &model::EventCounters::pnfs_write},
};

struct OpField { const char* name; int64_t model::OperationCounters::* field; };

constexpr OpField kOpFields[] = {
  {"ops",          &model::OperationCounters::ops},
  {"ntrans",       &model::OperationCounters::ntrans},
  {"timeouts",     &model::OperationCounters::timeouts},
  {"bytes_sent",   &model::OperationCounters::bytes_sent},
  {"bytes_recv",   &model::OperationCounters::bytes_recv},
  {"queue_time",   &model::OperationCounters::queue_time},
  {"rtt",          &model::OperationCounters::rtt},
  {"execute_time", &model::OperationCounters::execute_time},
  {"errors",       &model::OperationCounters::errors},
};

static_assert(std::size(kEventFields) == 27);
static_assert(std::size(kOpFields) == kMinOpValues + 1);

std::string_view trim(std::string_view sv) {
  while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front()))) sv.remove_prefix(1);
  while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back()))) sv.remove_suffix(1);
  return sv;
}

int64_t parse_int(std::string_view tok, const std::string& field) {
  int64_t v = 0;
  auto [ptr, ec] = std::from_chars(tok.data(), tok.data() + tok.size(), v);
  if (ec == std::errc{} && ptr != tok.data() + tok.size()) ec = std::errc::invalid_argument;
  if (ec != std::errc{}) {
    throw MountstatsError(Kind::FieldParse,
                          "error parsing " + field + ": " + std::make_error_code(ec).message() +
                          " ('" + std::string(tok) + "')");
  }
  return v;
}

bool is_device_header(std::string_view line) {
  return line.starts_with(kDeviceTag) && line.contains("nfs") && line.contains(kOnSep);
}

bool is_reserved(std::string_view line) {
  for (auto p : kReservedPrefixes)
    if (line.starts_with(p)) return true;
  return false;
}

} // namespace

std::vector<std::string_view> split_ws(std::string_view s) {
  std::vector<std::string_view> out;
  size_t i = 0;
  while (i < s.size()) {
    while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) ++i;
    size_t start = i;
    while (i < s.size() && !std::isspace(static_cast<unsigned char>(s[i]))) ++i;
    if (i > start) out.push_back(s.substr(start, i - start));
  }
  return out;
}

model::EventCounters parse_events(const std::vector<std::string_view>& values) {
  if (values.size() < kMinEventValues) {
    throw MountstatsError(Kind::MalformedSection,
                          "invalid number of parts for events: " + std::to_string(values.size()));
  }
  model::EventCounters ev{};
  size_t n = std::min(values.size(), std::size(kEventFields));
  for (size_t i = 0; i < n; ++i)
    ev.*(kEventFields[i].field) = parse_int(values[i], kEventFields[i].name);
  return ev;
}

std::vector<std::pair<std::string_view, int64_t>> event_values(const model::EventCounters& ev) {
  std::vector<std::pair<std::string_view, int64_t>> out;
  out.reserve(std::size(kEventFields));
  for (const auto& f : kEventFields) out.emplace_back(f.name, ev.*(f.field));
  return out;
}

model::OperationCounters parse_operation(std::string_view name,
                                         const std::vector<std::string_view>& values) {
  if (values.size() < kMinOpValues) {
    throw MountstatsError(Kind::InsufficientTokens,
                          "insufficient stats for operation " + std::string(name) + ": got " +
                          std::to_string(values.size()) + ", need " + std::to_string(kMinOpValues));
  }
  model::OperationCounters op{};
  op.name = std::string(name);
  size_t n = std::min(values.size(), std::size(kOpFields));
  for (size_t i = 0; i < n; ++i) {
    op.*(kOpFields[i].field) = parse_int(values[i], op.name + "_" + kOpFields[i].name);
  }
  return op;
}

void MountstatsParser::feed(std::string_view raw) {
  auto line = trim(raw);
  if (is_device_header(line)) { open_mount(line); return; }
  if (section_ != Section::Mount) return; // preamble or unrelated report sections

  if (line.starts_with("age:")) { parse_age(split_ws(line)); return; }
  if (line.starts_with("events:")) { parse_events_line(split_ws(line)); return; }
  if (line.starts_with("bytes:")) { parse_bytes(split_ws(line)); return; }
  if (line.contains(':') && !is_reserved(line)) { parse_operation_line(line); return; }
}

model::MountMap MountstatsParser::finish() {
  current_ = nullptr;
  section_ = Section::Preamble;
  return std::move(mounts_);
}

// device server:/export mounted on /mnt/nfs with fstype nfs statvers=1.1
void MountstatsParser::open_mount(std::string_view line) {
  auto on = line.find(kOnSep);
  auto left = split_ws(line.substr(0, on));
  auto right = split_ws(line.substr(on + kOnSep.size()));
  if (left.size() < 2 || right.empty()) {
    throw MountstatsError(Kind::MalformedSection, "invalid device line: " + std::string(line));
  }

  model::MountSnapshot m{};
  m.device = std::string(left[1]);
  m.mount_point = std::string(right[0]);
  auto colon = m.device.find(':');
  if (colon == std::string::npos) {
    m.server = m.device;
    m.export_path = "/";
  } else {
    m.server = m.device.substr(0, colon);
    m.export_path = m.device.substr(colon + 1);
  }

  auto& slot = mounts_[m.mount_point];
  slot = std::move(m);
  current_ = &slot;
  section_ = Section::Mount;
}

void MountstatsParser::parse_age(const std::vector<std::string_view>& tok) {
  if (tok.size() < 2) throw MountstatsError(Kind::MalformedSection, "invalid age line: missing value");
  current_->age = parse_int(tok[1], "age");
}

void MountstatsParser::parse_events_line(const std::vector<std::string_view>& tok) {
  if (tok.size() < 2) throw MountstatsError(Kind::MalformedSection, "invalid events line: no values");
  std::vector<std::string_view> values(tok.begin() + 1, tok.end());
  current_->events = parse_events(values);
}

// Report versions disagree on where the written-bytes total sits: prefer
// token 6 when it is present and non-zero, fall back to token 5.
void MountstatsParser::parse_bytes(const std::vector<std::string_view>& tok) {
  if (tok.size() < kMinBytesTokens) {
    throw MountstatsError(Kind::MalformedSection,
                          "invalid bytes line: got " + std::to_string(tok.size()) + " fields, need " +
                          std::to_string(kMinBytesTokens));
  }
  current_->bytes_read = parse_int(tok[1], "bytes_read");
  if (tok.size() > 6 && tok[6] != "0") current_->bytes_write = parse_int(tok[6], "bytes_write");
  else if (tok.size() > 5) current_->bytes_write = parse_int(tok[5], "bytes_write");
  else current_->bytes_write = 0;
}

void MountstatsParser::parse_operation_line(std::string_view line) {
  auto colon = line.find(':');
  auto name = trim(line.substr(0, colon));
  auto op = parse_operation(name, split_ws(line.substr(colon + 1)));
  current_->operations.insert_or_assign(op.name, std::move(op));
}

model::MountMap parse_mountstats(const std::vector<std::string>& lines) {
  MountstatsParser p;
  for (const auto& l : lines) p.feed(l);
  return p.finish();
}

model::MountMap parse_mountstats_text(std::string_view text) {
  MountstatsParser p;
  size_t pos = 0;
  while (pos < text.size()) {
    auto nl = text.find('\n', pos);
    if (nl == std::string_view::npos) nl = text.size();
    p.feed(text.substr(pos, nl - pos));
    pos = nl + 1;
  }
  return p.finish();
}

model::MountMap parse_mountstats_file(const std::string& path) {
  auto text = util::read_file_string(path);
  if (!text) throw MountstatsError(Kind::Io, "cannot read " + path);
  return parse_mountstats_text(*text);
}

} // namespace nfsgaze::collectors
