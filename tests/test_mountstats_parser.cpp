#include "minitest.hpp"
#include "collectors/MountstatsParser.hpp"
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

using nfsgaze::collectors::MountstatsError;
using nfsgaze::collectors::parse_mountstats;
using nfsgaze::collectors::parse_mountstats_text;

static std::string read_fixture(const char* name) {
  std::ifstream in(std::string(NFSGAZE_TEST_FIXTURES) + "/" + name);
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

static const char* kSingleMount =
  "device server:/export mounted on /mnt/nfs with fstype nfs statvers=1.1\n"
  "age: 3600\n"
  "events: 1 2 3 4 5 6 7 8 9 10 11 12 13 14 15 16 17 18 19 20 21 22 23 24 25 26 27\n"
  "bytes: 1000 2000 0 0 3000 4000 5000\n"
  "READ: 100 95 5 1024 2048 10 20 30 2\n"
  "WRITE: 50 50 0 4096 512 5 10 15\n";

TEST(parser_device_line_fields) {
  auto mounts = parse_mountstats_text(kSingleMount);
  ASSERT_EQ(mounts.size(), 1u);
  const auto& m = mounts.at("/mnt/nfs");
  ASSERT_EQ(m.device, "server:/export");
  ASSERT_EQ(m.mount_point, "/mnt/nfs");
  ASSERT_EQ(m.server, "server");
  ASSERT_EQ(m.export_path, "/export");
  ASSERT_EQ(m.age, 3600);
}

TEST(parser_device_without_colon_defaults_export) {
  auto mounts = parse_mountstats_text("device server mounted on /mnt/x with fstype nfs\n");
  const auto& m = mounts.at("/mnt/x");
  ASSERT_EQ(m.server, "server");
  ASSERT_EQ(m.export_path, "/");
}

TEST(parser_operation_counters) {
  auto mounts = parse_mountstats_text(kSingleMount);
  const auto& ops = mounts.at("/mnt/nfs").operations;
  ASSERT_EQ(ops.size(), 2u);
  const auto& r = ops.at("READ");
  ASSERT_EQ(r.name, "READ");
  ASSERT_EQ(r.ops, 100);
  ASSERT_EQ(r.ntrans, 95);
  ASSERT_EQ(r.timeouts, 5);
  ASSERT_EQ(r.bytes_sent, 1024);
  ASSERT_EQ(r.bytes_recv, 2048);
  ASSERT_EQ(r.queue_time, 10);
  ASSERT_EQ(r.rtt, 20);
  ASSERT_EQ(r.execute_time, 30);
  ASSERT_EQ(r.errors, 2);
  // eight values only: errors defaults to zero
  ASSERT_EQ(ops.at("WRITE").errors, 0);
  ASSERT_EQ(ops.at("WRITE").execute_time, 15);
}

TEST(parser_events_with_pnfs) {
  auto mounts = parse_mountstats_text(kSingleMount);
  const auto& ev = mounts.at("/mnt/nfs").events;
  ASSERT_TRUE(ev.has_value());
  ASSERT_EQ(ev->inode_revalidate, 1);
  ASSERT_EQ(ev->attr_invalidate, 4);
  ASSERT_EQ(ev->vfs_open, 5);
  ASSERT_EQ(ev->delay, 25);
  ASSERT_EQ(ev->pnfs_read, 26);
  ASSERT_EQ(ev->pnfs_write, 27);
}

TEST(parser_events_without_pnfs) {
  std::vector<std::string_view> vals(25, "7");
  auto ev = nfsgaze::collectors::parse_events(vals);
  ASSERT_EQ(ev.delay, 7);
  ASSERT_EQ(ev.pnfs_read, 0);
  ASSERT_EQ(ev.pnfs_write, 0);
}

TEST(parser_events_absent) {
  auto mounts = parse_mountstats_text(
    "device s:/e mounted on /m with fstype nfs\n"
    "READ: 1 1 0 0 0 0 0 0\n");
  ASSERT_TRUE(!mounts.at("/m").events.has_value());
}

TEST(parser_events_too_short) {
  std::vector<std::string_view> vals(24, "1");
  bool thrown = false;
  try {
    (void)nfsgaze::collectors::parse_events(vals);
  } catch (const MountstatsError& e) {
    thrown = true;
    ASSERT_TRUE(e.kind() == MountstatsError::Kind::MalformedSection);
    ASSERT_TRUE(std::string(e.what()).find("24") != std::string::npos);
  }
  ASSERT_TRUE(thrown);
}

TEST(parser_bytes_prefers_token_six) {
  auto mounts = parse_mountstats_text(kSingleMount);
  const auto& m = mounts.at("/mnt/nfs");
  ASSERT_EQ(m.bytes_read, 1000);
  ASSERT_EQ(m.bytes_write, 4000);
}

TEST(parser_bytes_falls_back_to_token_five) {
  auto a = parse_mountstats_text(
    "device s:/e mounted on /m with fstype nfs\n"
    "bytes: 10 20 30 40 50 0 70\n");
  ASSERT_EQ(a.at("/m").bytes_write, 50);
  auto b = parse_mountstats_text(
    "device s:/e mounted on /m with fstype nfs\n"
    "bytes: 10 20 30 40 50\n");
  ASSERT_EQ(b.at("/m").bytes_read, 10);
  ASSERT_EQ(b.at("/m").bytes_write, 50);
}

TEST(parser_bytes_write_in_token_six) {
  auto m = parse_mountstats_text(
    "device s:/e mounted on /m with fstype nfs\n"
    "bytes: 1048576 0 0 0 0 2097152 0 0\n");
  ASSERT_EQ(m.at("/m").bytes_read, 1048576);
  ASSERT_EQ(m.at("/m").bytes_write, 2097152);
}

TEST(parser_bytes_too_short) {
  ASSERT_THROWS(parse_mountstats_text(
    "device s:/e mounted on /m with fstype nfs\n"
    "bytes: 10 20 30\n"), MountstatsError);
}

TEST(parser_operation_insufficient_tokens) {
  bool thrown = false;
  try {
    (void)parse_mountstats_text(
      "device s:/e mounted on /m with fstype nfs\n"
      "READ: 1 2 3 4 5 6 7\n");
  } catch (const MountstatsError& e) {
    thrown = true;
    std::string msg = e.what();
    ASSERT_TRUE(e.kind() == MountstatsError::Kind::InsufficientTokens);
    ASSERT_TRUE(msg.find("READ") != std::string::npos);
    ASSERT_TRUE(msg.find("7") != std::string::npos);
  }
  ASSERT_TRUE(thrown);
}

TEST(parser_bad_number_names_field) {
  bool thrown = false;
  try {
    (void)parse_mountstats_text(
      "device s:/e mounted on /m with fstype nfs\n"
      "READ: 1 2 x 4 5 6 7 8\n");
  } catch (const MountstatsError& e) {
    thrown = true;
    ASSERT_TRUE(e.kind() == MountstatsError::Kind::FieldParse);
    ASSERT_TRUE(std::string(e.what()).find("READ_timeouts") != std::string::npos);
  }
  ASSERT_TRUE(thrown);
}

TEST(parser_bad_age) {
  ASSERT_THROWS(parse_mountstats_text(
    "device s:/e mounted on /m with fstype nfs\n"
    "age: soon\n"), MountstatsError);
}

TEST(parser_reserved_sections_are_not_operations) {
  auto mounts = parse_mountstats_text(
    "device s:/e mounted on /m with fstype nfs\n"
    "opts: rw,vers=3\n"
    "caps: caps=0x3fef\n"
    "sec: flavor=1\n"
    "nfsv4: bm0=0x1\n"
    "RPC iostats version: 1.0 p/v: 100003/3 (nfs)\n"
    "xprt: tcp 0 1 1 0 0 10 10 0 10 0 2 0 0\n"
    "per-op statistics\n"
    "GETATTR: 8 8 0 896 896 0 8 8\n");
  const auto& ops = mounts.at("/m").operations;
  ASSERT_EQ(ops.size(), 1u);
  ASSERT_TRUE(ops.contains("GETATTR"));
}

TEST(parser_preamble_lines_ignored) {
  auto mounts = parse_mountstats_text(
    "READ: not even numbers\n"
    "device proc mounted on /proc with fstype proc\n"
    "device s:/e mounted on /m with fstype nfs\n");
  ASSERT_EQ(mounts.size(), 1u);
  ASSERT_TRUE(mounts.contains("/m"));
}

TEST(parser_non_nfs_device_keeps_nfs_block_open) {
  auto mounts = parse_mountstats_text(
    "device srv:/x mounted on /mnt/a with fstype nfs statvers=1.1\n"
    "device sysfs mounted on /sys with fstype sysfs\n"
    "\tREAD: 5 5 0 0 0 0 0 0\n");
  ASSERT_EQ(mounts.size(), 1u);
  ASSERT_TRUE(!mounts.contains("/sys"));
  ASSERT_EQ(mounts.at("/mnt/a").operations.size(), 1u);
  ASSERT_EQ(mounts.at("/mnt/a").operations.at("READ").ops, 5);
}

TEST(parser_multiple_mounts_keep_their_own_fields) {
  auto mounts = parse_mountstats_text(
    "device a:/x mounted on /a with fstype nfs\n"
    "age: 10\n"
    "READ: 1 1 0 0 0 0 0 0\n"
    "device b:/y mounted on /b with fstype nfs4\n"
    "age: 20\n"
    "WRITE: 2 2 0 0 0 0 0 0\n");
  ASSERT_EQ(mounts.size(), 2u);
  ASSERT_EQ(mounts.at("/a").age, 10);
  ASSERT_EQ(mounts.at("/b").age, 20);
  ASSERT_TRUE(mounts.at("/a").operations.contains("READ"));
  ASSERT_TRUE(!mounts.at("/a").operations.contains("WRITE"));
  ASSERT_TRUE(mounts.at("/b").operations.contains("WRITE"));
}

TEST(parser_line_vector_matches_text) {
  std::vector<std::string> lines = {
    "device s:/e mounted on /m with fstype nfs",
    "age: 5",
    "READ: 100 95 5 1024 2048 10 20 30 2",
  };
  auto a = parse_mountstats(lines);
  auto b = parse_mountstats_text("device s:/e mounted on /m with fstype nfs\nage: 5\nREAD: 100 95 5 1024 2048 10 20 30 2\n");
  ASSERT_TRUE(a == b);
}

TEST(parser_is_idempotent) {
  auto a = parse_mountstats_text(kSingleMount);
  auto b = parse_mountstats_text(kSingleMount);
  ASSERT_TRUE(a == b);
}

TEST(parser_empty_input) {
  ASSERT_TRUE(parse_mountstats_text("").empty());
}

TEST(parser_tab_indented_report) {
  auto mounts = parse_mountstats_text(read_fixture("mountstats.txt"));
  ASSERT_EQ(mounts.size(), 2u);

  const auto& home = mounts.at("/mnt/home");
  ASSERT_EQ(home.server, "nfs1.example.com");
  ASSERT_EQ(home.export_path, "/export/home");
  ASSERT_EQ(home.age, 3600);
  ASSERT_EQ(home.operations.size(), 6u);
  ASSERT_EQ(home.operations.at("READ").bytes_recv, 1066000);
  ASSERT_EQ(home.operations.at("LOOKUP").errors, 3);
  ASSERT_TRUE(home.events.has_value());
  ASSERT_EQ(home.events->vfs_open, 24);
  ASSERT_EQ(home.bytes_read, 1048576);
  ASSERT_EQ(home.bytes_write, 786432);

  const auto& data = mounts.at("/mnt/data");
  ASSERT_EQ(data.age, 7200);
  ASSERT_EQ(data.operations.size(), 3u);
  ASSERT_EQ(data.operations.at("READ").execute_time, 5);
  ASSERT_EQ(data.events->pnfs_write, 0);
}

TEST(parser_event_values_in_report_order) {
  auto mounts = parse_mountstats_text(kSingleMount);
  auto vals = nfsgaze::collectors::event_values(*mounts.at("/mnt/nfs").events);
  ASSERT_EQ(vals.size(), 27u);
  ASSERT_EQ(vals.front().first, "InodeRevalidate");
  ASSERT_EQ(vals.front().second, 1);
  ASSERT_EQ(vals.back().first, "PNFSWrite");
  ASSERT_EQ(vals.back().second, 27);
}

TEST(split_ws_handles_tabs_and_runs) {
  auto t = nfsgaze::collectors::split_ws("\t a  b\t\tc ");
  ASSERT_EQ(t.size(), 3u);
  ASSERT_EQ(t[0], "a");
  ASSERT_EQ(t[2], "c");
}

TEST(parser_file_reads_fixture) {
  auto mounts = nfsgaze::collectors::parse_mountstats_file(std::string(NFSGAZE_TEST_FIXTURES) + "/mountstats.txt");
  ASSERT_EQ(mounts.size(), 2u);
}

TEST(parser_file_missing_is_io_error) {
  bool thrown = false;
  try {
    (void)nfsgaze::collectors::parse_mountstats_file("/nonexistent/nfsgaze/mountstats");
  } catch (const MountstatsError& e) {
    thrown = true;
    ASSERT_TRUE(e.kind() == MountstatsError::Kind::Io);
  }
  ASSERT_TRUE(thrown);
}
