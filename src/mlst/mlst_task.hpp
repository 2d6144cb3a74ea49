#pragma once

#include <string>
#include <vector>

#include "core/config.hpp"
#include "util/logger.hpp"

namespace contigsift {

struct MlstOptions {
    std::string executable = DEFAULT_MLST_EXE;  // resolved through PATH
    std::vector<std::string> extra_args;        // placed before the FASTA path
    unsigned timeout_sec = 0;                   // 0 = wait indefinitely
};

// One typing-tool invocation for one sample. Tasks share no state, so any
// task can be rerun or run on another thread on its own.
struct MlstTask {
    std::string sample;
    std::string input_path;   // FASTA passed as the sole positional argument
    std::string output_path;  // receives the tool's stdout verbatim
};

enum class MlstStatus {
    kOk,
    kMissingInput,
    kOutputFailed,
    kLaunchFailed,
    kNonZeroExit,
    kSignaled,
    kTimedOut,
};

const char* mlst_status_name(MlstStatus status);

struct MlstResult {
    MlstTask task;
    MlstStatus status = MlstStatus::kOk;
    int exit_code = 0;  // exit status, or signal number for kSignaled
    std::string error;

    bool ok() const { return status == MlstStatus::kOk; }
};

// e.g. mlst_output_path("out", "S1") -> "out/S1_mlst_output"
std::string mlst_output_path(const std::string& output_dir,
                             const std::string& sample);

// argv for the child: executable, extra args, input path.
std::vector<std::string> build_mlst_argv(const MlstTask& task,
                                         const MlstOptions& opts);

// Split a whitespace-separated argument string ("--scheme ecoli").
std::vector<std::string> split_args(const std::string& text);

// Run the typing tool synchronously for one task.
MlstResult run_mlst_task(const MlstTask& task, const MlstOptions& opts,
                         const Logger& logger);

} // namespace contigsift
