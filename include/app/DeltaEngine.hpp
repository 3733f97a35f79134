#pragma once
#include <vector>
#include "model/Mount.hpp"
#include "model/Delta.hpp"

namespace nfsgaze::app {

// Per-operation rates between two snapshots of the same mount.
// Operations absent from `previous` count from zero. Only operations with
// delta_ops > 0 are returned, sorted by name. Negative raw deltas (remount)
// are passed through unclamped.
[[nodiscard]] std::vector<nfsgaze::model::DeltaRecord>
compute_deltas(const nfsgaze::model::MountSnapshot& previous,
               const nfsgaze::model::MountSnapshot& current,
               double elapsed_seconds);

// Single operation, no filtering
[[nodiscard]] nfsgaze::model::DeltaRecord
operation_delta(const nfsgaze::model::OperationCounters& previous,
                const nfsgaze::model::OperationCounters& current,
                double elapsed_seconds);

// Since-mount view: every operation with ops > 0 measured against zero
// over the mount's age.
[[nodiscard]] std::vector<nfsgaze::model::DeltaRecord>
cumulative_deltas(const nfsgaze::model::MountSnapshot& mount);

} // namespace nfsgaze::app
