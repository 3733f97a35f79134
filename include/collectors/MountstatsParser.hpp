// Parser for /proc/self/mountstats
#pragma once
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include "model/Mount.hpp"

namespace nfsgaze::collectors {

class MountstatsError : public std::runtime_error {
public:
  enum class Kind { MalformedSection, FieldParse, InsufficientTokens, Io };

  MountstatsError(Kind kind, const std::string& what)
      : std::runtime_error(what), kind_(kind) {}

  [[nodiscard]] Kind kind() const noexcept { return kind_; }

private:
  Kind kind_;
};

// Positional values of an "events:" line (without the leading tag).
// Needs at least 25 values; the pNFS pair is optional.
[[nodiscard]] model::EventCounters parse_events(const std::vector<std::string_view>& values);

// (name, value) for every event counter, in report order
[[nodiscard]] std::vector<std::pair<std::string_view, int64_t>> event_values(const model::EventCounters& ev);

// Values following "<name>:" on a per-op line. Needs at least 8; the
// 9th (errors) is optional.
[[nodiscard]] model::OperationCounters parse_operation(std::string_view name,
                                                       const std::vector<std::string_view>& values);

// Line-at-a-time state machine. Throws MountstatsError from feed() on the
// first malformed line; the partial result must then be discarded.
class MountstatsParser {
public:
  void feed(std::string_view line);
  [[nodiscard]] model::MountMap finish();

private:
  enum class Section { Preamble, Mount };

  void open_mount(std::string_view line);
  void parse_age(const std::vector<std::string_view>& tok);
  void parse_events_line(const std::vector<std::string_view>& tok);
  void parse_bytes(const std::vector<std::string_view>& tok);
  void parse_operation_line(std::string_view line);

  Section section_{Section::Preamble};
  model::MountSnapshot* current_{nullptr}; // node in mounts_, stable across rehash
  model::MountMap mounts_;
};

// Whole-report helpers. All-or-nothing: any malformed line throws.
[[nodiscard]] model::MountMap parse_mountstats(const std::vector<std::string>& lines);
[[nodiscard]] model::MountMap parse_mountstats_text(std::string_view text);
// Reads through util::map_proc_path; an unreadable file throws Kind::Io.
[[nodiscard]] model::MountMap parse_mountstats_file(const std::string& path);

// Splits on runs of spaces and tabs
[[nodiscard]] std::vector<std::string_view> split_ws(std::string_view s);

} // namespace nfsgaze::collectors
