#pragma once

#include "model/Delta.hpp"
#include "model/Mount.hpp"
#include <ctime>
#include <ostream>
#include <string>
#include <vector>

namespace nfsgaze::ui {

// One table per mount: OP IOPS RTT(ms) EXE(ms) [MB/s KB/op] ERRORS.
// Prints nothing for an empty record list.
void render_simple(std::ostream& os,
                   const nfsgaze::model::MountSnapshot& mount,
                   const std::vector<nfsgaze::model::DeltaRecord>& records,
                   bool show_bandwidth,
                   std::time_t now);

// nfsiostat layout. Attribute cache events need the previous snapshot;
// they are skipped when `previous` is null or either side has no events line.
void render_iostat(std::ostream& os,
                   const nfsgaze::model::MountSnapshot& mount,
                   const std::vector<nfsgaze::model::DeltaRecord>& records,
                   const nfsgaze::model::MountSnapshot* previous,
                   bool show_attr);

// Banner printed once before the first report
void render_summary(std::ostream& os,
                    const std::string& selected_mount,
                    const std::vector<const nfsgaze::model::MountSnapshot*>& mounts,
                    const std::vector<std::string>& operations);

void clear_screen(std::ostream& os);

} // namespace nfsgaze::ui
