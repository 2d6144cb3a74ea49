#include "mlst/mlst_runner.hpp"

#include <exception>
#include <utility>

#include <tbb/parallel_for.h>
#include <tbb/task_arena.h>

namespace contigsift {

bool plan_mlst_tasks(const std::string& root,
                     const std::string& output_dir,
                     const SampleLayout& layout,
                     std::vector<MlstTask>& tasks,
                     std::string& err) {
    tasks.clear();
    std::vector<SampleDir> samples;
    if (!discover_samples(root, layout, samples, err)) return false;

    for (const auto& s : samples) {
        if (!s.has_input) continue;
        MlstTask t;
        t.sample = s.name;
        t.input_path = s.input_path;
        t.output_path = mlst_output_path(output_dir, s.name);
        tasks.push_back(std::move(t));
    }
    return true;
}

static MlstResult run_one(const MlstTask& task, const MlstOptions& opts,
                          const Logger& logger) {
    MlstResult r;
    try {
        r = run_mlst_task(task, opts, logger);
    } catch (const std::exception& e) {
        r.task = task;
        r.status = MlstStatus::kLaunchFailed;
        r.error = e.what();
    }

    if (r.ok()) {
        logger.info("%s: MLST report written to %s",
                    task.sample.c_str(), task.output_path.c_str());
    } else {
        logger.error("%s: mlst %s: %s", task.sample.c_str(),
                     mlst_status_name(r.status), r.error.c_str());
    }
    return r;
}

MlstSummary run_mlst_tasks(const std::vector<MlstTask>& tasks,
                           const MlstOptions& opts,
                           int threads,
                           const Logger& logger) {
    MlstSummary summary;
    summary.results.resize(tasks.size());

    if (threads > 1 && tasks.size() > 1) {
        tbb::task_arena arena(threads);
        arena.execute([&] {
            tbb::parallel_for(size_t(0), tasks.size(), [&](size_t i) {
                summary.results[i] = run_one(tasks[i], opts, logger);
            });
        });
    } else {
        for (size_t i = 0; i < tasks.size(); i++) {
            summary.results[i] = run_one(tasks[i], opts, logger);
        }
    }

    for (const auto& r : summary.results) {
        if (r.ok()) summary.succeeded++;
        else summary.failed++;
    }
    return summary;
}

} // namespace contigsift
