#include "io/sample_discovery.hpp"

#include <algorithm>
#include <filesystem>
#include <system_error>

namespace contigsift {

namespace fs = std::filesystem;

SampleDir make_sample_dir(const std::string& dir, const SampleLayout& layout) {
    fs::path p(dir);
    SampleDir s;
    s.name = p.filename().string();
    s.dir = p.string();
    s.input_path = (p / layout.input_name).string();
    s.output_path = (p / layout.output_name).string();

    std::error_code ec;
    s.has_input = fs::is_regular_file(s.input_path, ec) && !ec;
    return s;
}

bool discover_samples(const std::string& root,
                      const SampleLayout& layout,
                      std::vector<SampleDir>& samples,
                      std::string& err) {
    samples.clear();

    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        err = ec ? "cannot access root directory '" + root + "': " + ec.message()
                 : "root directory '" + root + "' does not exist or is not a directory";
        return false;
    }

    fs::directory_iterator it(root, ec);
    if (ec) {
        err = "cannot list root directory '" + root + "': " + ec.message();
        return false;
    }

    fs::directory_iterator end;
    for (; it != end; it.increment(ec)) {
        if (ec) break;
        const auto& entry = *it;
        std::error_code type_ec;
        if (!entry.is_directory(type_ec) || type_ec) continue;
        std::string name = entry.path().filename().string();
        if (name.empty() || name[0] == '.') continue;
        samples.push_back(make_sample_dir(entry.path().string(), layout));
    }
    if (ec) {
        err = "error while listing '" + root + "': " + ec.message();
        return false;
    }

    std::sort(samples.begin(), samples.end(),
              [](const SampleDir& a, const SampleDir& b) {
                  return a.name < b.name;
              });
    return true;
}

} // namespace contigsift
