#pragma once

#include "util/cli_parser.hpp"
#include "util/logger.hpp"

#include <cstdio>
#include <thread>

// CONTIGSIFT_VERSION is defined in the generated core/version.hpp.
// Callers must include core/version.hpp before using check_version().

namespace contigsift {

// Print "<cmd_name> <version>" to stderr if --version is present.
// Returns true if --version was handled (caller should return 0).
inline bool check_version(const CliParser& cli, const char* cmd_name) {
    if (cli.has("--version")) {
        std::fprintf(stderr, "%s %s\n", cmd_name, CONTIGSIFT_VERSION);
        return true;
    }
    return false;
}

// Create a Logger from -v / --verbose flags.
inline Logger make_logger(const CliParser& cli) {
    bool verbose = cli.has("-v") || cli.has("--verbose");
    return Logger(verbose ? Logger::kDebug : Logger::kInfo);
}

// Resolve thread count from CLI. Samples are processed one at a time
// unless -threads is given; 0 or negative means hardware_concurrency.
// Returns false if the value is not an integer.
inline bool resolve_threads(const CliParser& cli, int& threads,
                            const std::string& key = "-threads") {
    int n = 1;
    if (!cli.get_int_checked(key, 1, n)) return false;
    if (n <= 0) {
        n = static_cast<int>(std::thread::hardware_concurrency());
        if (n <= 0) n = 1;
    }
    threads = n;
    return true;
}

} // namespace contigsift
