#include "pipeline/directory_walker.hpp"

#include <exception>
#include <utility>

#include <tbb/parallel_for.h>
#include <tbb/task_arena.h>

namespace contigsift {

const char* sample_status_name(SampleStatus status) {
    switch (status) {
    case SampleStatus::kFiltered:       return "filtered";
    case SampleStatus::kSkippedNoInput: return "skipped";
    case SampleStatus::kFailed:         return "failed";
    }
    return "unknown";
}

DirectoryWalker::DirectoryWalker(std::string root, const WalkerConfig& config,
                                 const Logger& logger)
    : root_(std::move(root)),
      config_(config),
      filter_(config.min_length),
      logger_(logger) {}

SampleResult DirectoryWalker::process_sample(const SampleDir& sample) const {
    SampleResult result;
    result.name = sample.name;

    if (!sample.has_input) {
        result.status = SampleStatus::kSkippedNoInput;
        logger_.debug("%s: no %s, skipped", sample.name.c_str(),
                      config_.layout.input_name.c_str());
        return result;
    }

    bool ok = false;
    try {
        ok = filter_fasta_file(sample.input_path, sample.output_path,
                               filter_, result.stats, logger_);
    } catch (const std::exception& e) {
        result.error = e.what();
    }

    if (!ok) {
        result.status = SampleStatus::kFailed;
        if (result.error.empty()) result.error = "cannot filter " + sample.input_path;
        logger_.error("%s: %s", sample.name.c_str(), result.error.c_str());
        return result;
    }

    result.status = SampleStatus::kFiltered;
    logger_.info("%s: kept %lu of %lu contig(s) (%lu bases)",
                 sample.name.c_str(),
                 static_cast<unsigned long>(result.stats.records_out),
                 static_cast<unsigned long>(result.stats.records_in),
                 static_cast<unsigned long>(result.stats.bases_out));
    if (result.stats.malformed > 0) {
        logger_.warn("%s: %lu record(s) with an empty header",
                     sample.name.c_str(),
                     static_cast<unsigned long>(result.stats.malformed));
    }
    return result;
}

bool DirectoryWalker::run(WalkSummary& summary) const {
    summary = WalkSummary{};

    std::vector<SampleDir> samples;
    std::string err;
    if (!discover_samples(root_, config_.layout, samples, err)) {
        logger_.error("%s", err.c_str());
        return false;
    }

    logger_.info("Found %zu sample directory(ies) in %s (min_length=%zu)",
                 samples.size(), root_.c_str(), config_.min_length);

    // Each sample writes only its own slot, so results stay in name order.
    summary.samples.resize(samples.size());
    if (config_.threads > 1 && samples.size() > 1) {
        tbb::task_arena arena(config_.threads);
        arena.execute([&] {
            tbb::parallel_for(size_t(0), samples.size(), [&](size_t i) {
                summary.samples[i] = process_sample(samples[i]);
            });
        });
    } else {
        for (size_t i = 0; i < samples.size(); i++) {
            summary.samples[i] = process_sample(samples[i]);
        }
    }

    for (const auto& r : summary.samples) {
        switch (r.status) {
        case SampleStatus::kFiltered:       summary.filtered++; break;
        case SampleStatus::kSkippedNoInput: summary.skipped++;  break;
        case SampleStatus::kFailed:         summary.failed++;   break;
        }
    }
    return true;
}

} // namespace contigsift
