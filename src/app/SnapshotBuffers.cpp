#include "app/SnapshotBuffers.hpp"

namespace nfsgaze::app {

void SnapshotBuffers::publish(nfsgaze::model::Snapshot s) {
  std::lock_guard<std::mutex> lk(mu_);
  s.seq = front_.seq + 1;
  front_ = std::move(s);
  seq_.store(front_.seq, std::memory_order_release);
}

nfsgaze::model::Snapshot SnapshotBuffers::read() const {
  std::lock_guard<std::mutex> lk(mu_);
  return front_;
}

} // namespace nfsgaze::app
