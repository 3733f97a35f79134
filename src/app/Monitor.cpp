#include "app/Monitor.hpp"
#include "app/DeltaEngine.hpp"
#include "model/Snapshot.hpp"
#include "ui/Renderer.hpp"
#include <algorithm>
#include <cstdio>
#include <thread>

namespace nfsgaze::app {

using Clock = std::chrono::steady_clock;

std::optional<std::vector<std::string>>
select_mounts(const nfsgaze::model::MountMap& mounts, const std::string& mount_point) {
  std::vector<std::string> out;
  if (!mount_point.empty()) {
    if (!mounts.contains(mount_point)) return std::nullopt;
    out.push_back(mount_point);
    return out;
  }
  out.reserve(mounts.size());
  for (const auto& [mp, m] : mounts) out.push_back(mp);
  std::sort(out.begin(), out.end());
  return out;
}

Monitor::Monitor(nfsgaze::collectors::MountstatsCollector& collector, MonitorOptions opts,
                 SnapshotBuffers* buffers)
    : collector_(collector), opts_(std::move(opts)), filter_(opts_.filter), buffers_(buffers) {}

void Monitor::print_initial_summary(std::ostream& os) const {
  auto selected = select_mounts(previous_, opts_.mount_point);
  if (!selected) return;

  if (opts_.iostat) {
    for (const auto& mp : *selected) {
      const auto& m = previous_.at(mp);
      auto deltas = filter_.apply(cumulative_deltas(m));
      if (!deltas.empty()) ui::render_iostat(os, m, deltas, nullptr, opts_.show_attr);
    }
    return;
  }

  std::vector<const nfsgaze::model::MountSnapshot*> mounts;
  for (const auto& mp : *selected) mounts.push_back(&previous_.at(mp));
  std::vector<std::string> ops(filter_.names().begin(), filter_.names().end());
  std::sort(ops.begin(), ops.end());
  ui::render_summary(os, opts_.mount_point, mounts, ops);
}

void Monitor::step(nfsgaze::model::MountMap current, double elapsed_sec, std::time_t now, std::ostream& os) {
  if (opts_.clear_screen && !opts_.iostat) ui::clear_screen(os);

  nfsgaze::model::Snapshot snap{};
  snap.elapsed_sec = elapsed_sec;
  snap.parse_failures = parse_failures_;

  // A vanished mount is skipped; with no mount selected, new ones join
  // once they have a baseline.
  auto monitored = select_mounts(current, opts_.mount_point).value_or(std::vector<std::string>{});
  for (const auto& mp : monitored) {
    auto prev_it = previous_.find(mp);
    if (prev_it == previous_.end()) continue;
    const auto& cur = current.at(mp);

    auto deltas = filter_.apply(compute_deltas(prev_it->second, cur, elapsed_sec));
    if (opts_.iostat) ui::render_iostat(os, cur, deltas, &prev_it->second, opts_.show_attr);
    else ui::render_simple(os, cur, deltas, opts_.show_bandwidth, now);

    snap.mounts.push_back(nfsgaze::model::MountReport{cur, std::move(deltas)});
  }
  os.flush();

  if (buffers_) buffers_->publish(std::move(snap));
  previous_ = std::move(current);
  ++reports_;
}

bool Monitor::sleep_interval(const std::atomic<bool>& stop) const {
  // Short slices so a signal is noticed promptly
  constexpr auto kSlice = std::chrono::milliseconds(100);
  auto deadline = Clock::now() + opts_.interval;
  while (!stop.load()) {
    auto now = Clock::now();
    if (now >= deadline) return true;
    std::this_thread::sleep_for(std::min<Clock::duration>(kSlice, deadline - now));
  }
  return false;
}

int Monitor::run(const std::atomic<bool>& stop, std::ostream& os) {
  nfsgaze::model::MountMap initial;
  if (!collector_.sample(initial)) {
    std::fprintf(stderr, "nfsgaze: cannot read mountstats from %s: %s\n",
                 collector_.path().c_str(), collector_.last_error().c_str());
    return 1;
  }
  if (initial.empty()) {
    std::fprintf(stderr, "nfsgaze: no NFS mounts found in %s\n", collector_.path().c_str());
    return 1;
  }
  if (!select_mounts(initial, opts_.mount_point)) {
    std::fprintf(stderr, "nfsgaze: mount point not found: %s\n", opts_.mount_point.c_str());
    return 1;
  }

  previous_ = std::move(initial);
  print_initial_summary(os);
  os.flush();

  auto last = Clock::now();
  while (!stop.load() && (opts_.count <= 0 || reports_ < opts_.count)) {
    if (!sleep_interval(stop)) break;

    nfsgaze::model::MountMap current;
    if (!collector_.sample(current)) {
      // Transient; the next interval is measured from the last good read
      ++parse_failures_;
      continue;
    }

    auto now = Clock::now();
    double elapsed = std::chrono::duration<double>(now - last).count();
    last = now;
    step(std::move(current), elapsed, std::time(nullptr), os);
  }

  os << "Monitoring stopped.\n";
  os.flush();
  return 0;
}

} // namespace nfsgaze::app
