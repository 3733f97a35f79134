#include "app/Filter.hpp"
#include <algorithm>
#include <cctype>

namespace nfsgaze::app {

OperationSet parse_operations_list(std::string_view text) {
  OperationSet out;
  size_t pos = 0;
  while (pos <= text.size()) {
    auto comma = text.find(',', pos);
    if (comma == std::string_view::npos) comma = text.size();
    auto item = text.substr(pos, comma - pos);
    while (!item.empty() && std::isspace(static_cast<unsigned char>(item.front()))) item.remove_prefix(1);
    while (!item.empty() && std::isspace(static_cast<unsigned char>(item.back()))) item.remove_suffix(1);
    if (!item.empty()) out.emplace(item);
    pos = comma + 1;
  }
  return out;
}

std::vector<nfsgaze::model::DeltaRecord>
filter_operations(std::vector<nfsgaze::model::DeltaRecord> records, const OperationSet& names) {
  if (names.empty()) return records;
  std::erase_if(records, [&](const auto& r){ return names.count(r.operation) == 0; });
  return records;
}

OperationFilter::OperationFilter(OperationFilterSpec spec) : spec_(std::move(spec)) {}

std::vector<nfsgaze::model::DeltaRecord>
OperationFilter::apply(std::vector<nfsgaze::model::DeltaRecord> records) const {
  return filter_operations(std::move(records), spec_.names);
}

} // namespace nfsgaze::app
