#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "io/sample_discovery.hpp"
#include "mlst/mlst_task.hpp"
#include "util/logger.hpp"

namespace contigsift {

struct MlstSummary {
    std::vector<MlstResult> results;  // same order as the tasks
    std::size_t succeeded = 0;
    std::size_t failed = 0;
};

// One task per sample directory under root that holds an input file.
// Samples without one are left out. Reports are written to
// <output_dir>/<sample>_mlst_output.
bool plan_mlst_tasks(const std::string& root,
                     const std::string& output_dir,
                     const SampleLayout& layout,
                     std::vector<MlstTask>& tasks,
                     std::string& err);

// Run all tasks. Failures are logged per sample and never stop the pass.
// threads > 1 runs independent tasks concurrently.
MlstSummary run_mlst_tasks(const std::vector<MlstTask>& tasks,
                           const MlstOptions& opts,
                           int threads,
                           const Logger& logger);

} // namespace contigsift
