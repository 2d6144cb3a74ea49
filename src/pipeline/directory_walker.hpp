#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "filter/length_filter.hpp"
#include "io/sample_discovery.hpp"
#include "util/logger.hpp"

namespace contigsift {

struct WalkerConfig {
    SampleLayout layout;
    std::size_t min_length = DEFAULT_MIN_LENGTH;
    int threads = 1;  // > 1 processes samples concurrently
};

enum class SampleStatus {
    kFiltered,
    kSkippedNoInput,
    kFailed,
};

const char* sample_status_name(SampleStatus status);

struct SampleResult {
    std::string name;
    SampleStatus status = SampleStatus::kSkippedNoInput;
    FilterStats stats;
    std::string error;
};

struct WalkSummary {
    std::vector<SampleResult> samples;  // sorted by sample name
    std::size_t filtered = 0;
    std::size_t skipped = 0;
    std::size_t failed = 0;
};

// Runs the contig length filter over every sample directory below root.
// A failure in one sample is recorded in its SampleResult and never stops
// the remaining samples.
class DirectoryWalker {
public:
    DirectoryWalker(std::string root, const WalkerConfig& config,
                    const Logger& logger);

    // Returns false only if the root itself cannot be listed.
    bool run(WalkSummary& summary) const;

    // Filter a single sample directory.
    SampleResult process_sample(const SampleDir& sample) const;

    const std::string& root() const { return root_; }

private:
    std::string root_;
    WalkerConfig config_;
    LengthFilter filter_;
    const Logger& logger_;
};

} // namespace contigsift
