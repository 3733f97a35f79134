#include "collectors/MountstatsCollector.hpp"
#include "collectors/MountstatsParser.hpp"

#include <cstdio>
#include <utility>

namespace nfsgaze::collectors {

MountstatsCollector::MountstatsCollector(std::string path) : path_(std::move(path)) {}

bool MountstatsCollector::sample(nfsgaze::model::MountMap& out) {
  try {
    out = parse_mountstats_file(path_);
  } catch (const MountstatsError& e) {
    last_error_ = e.what();
    std::fprintf(stderr, "nfsgaze: mountstats: %s: %s\n", path_.c_str(), e.what());
    return false;
  }
  last_error_.clear();
  return true;
}

} // namespace nfsgaze::collectors
