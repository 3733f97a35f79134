#pragma once
#include "model/Delta.hpp"
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace nfsgaze::app {

using OperationSet = std::unordered_set<std::string>;

// Comma-separated operation names, whitespace trimmed, empties dropped.
[[nodiscard]] OperationSet parse_operations_list(std::string_view text);

// Keep records whose operation is in `names` (exact, case-sensitive).
// An empty set keeps everything.
[[nodiscard]] std::vector<nfsgaze::model::DeltaRecord>
filter_operations(std::vector<nfsgaze::model::DeltaRecord> records, const OperationSet& names);

struct OperationFilterSpec {
  OperationSet names;
};

class OperationFilter {
public:
  explicit OperationFilter(OperationFilterSpec spec);
  [[nodiscard]] std::vector<nfsgaze::model::DeltaRecord>
  apply(std::vector<nfsgaze::model::DeltaRecord> records) const;
  [[nodiscard]] bool empty() const { return spec_.names.empty(); }
  [[nodiscard]] const OperationSet& names() const { return spec_.names; }
private:
  OperationFilterSpec spec_;
};

} // namespace nfsgaze::app
