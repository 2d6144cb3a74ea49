#pragma once

#include <string>
#include <vector>

#include "core/config.hpp"

namespace contigsift {

// File names looked up inside every sample directory.
struct SampleLayout {
    std::string input_name = DEFAULT_INPUT_NAME;
    std::string output_name = DEFAULT_OUTPUT_NAME;
};

struct SampleDir {
    std::string name;        // directory basename (sample identity)
    std::string dir;         // <root>/<name>
    std::string input_path;  // <dir>/<input_name>
    std::string output_path; // <dir>/<output_name>
    bool has_input = false;
};

// Enumerate the immediate child directories of root.
// Hidden directories (leading '.') and non-directories are ignored.
// Results are sorted by name. Returns false (with err set) if root is
// missing, not a directory, or cannot be listed.
bool discover_samples(const std::string& root,
                      const SampleLayout& layout,
                      std::vector<SampleDir>& samples,
                      std::string& err);

// Build the per-sample descriptor for one directory.
SampleDir make_sample_dir(const std::string& dir, const SampleLayout& layout);

} // namespace contigsift
