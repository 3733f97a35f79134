#pragma once
#include <atomic>
#include <cstdint>
#include <mutex>
#include "model/Snapshot.hpp"

namespace nfsgaze::app {

// Hand-off point between the poll loop and readers on other threads.
// The loop publishes a copy; readers always get their own copy back.
class SnapshotBuffers {
public:
  SnapshotBuffers() = default;
  // Non-copyable
  SnapshotBuffers(const SnapshotBuffers&) = delete;
  SnapshotBuffers& operator=(const SnapshotBuffers&) = delete;

  void publish(nfsgaze::model::Snapshot s); // stamps seq
  [[nodiscard]] nfsgaze::model::Snapshot read() const;
  [[nodiscard]] uint64_t seq() const { return seq_.load(std::memory_order_acquire); }

private:
  mutable std::mutex mu_;
  nfsgaze::model::Snapshot front_{};
  std::atomic<uint64_t> seq_{0};
};

} // namespace nfsgaze::app
