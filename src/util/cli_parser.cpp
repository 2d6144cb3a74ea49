#include "util/cli_parser.hpp"

#include <cstdlib>
#include <stdexcept>

namespace contigsift {

CliParser::CliParser(int argc, char* argv[]) {
    if (argc > 0) {
        program_ = argv[0];
    }

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg.size() >= 2 && arg[0] == '-') {
            // Handle --key=value syntax for double-dash args
            if (arg.size() >= 3 && arg[1] == '-') {
                auto eq = arg.find('=');
                if (eq != std::string::npos) {
                    opts_[arg.substr(0, eq)].push_back(arg.substr(eq + 1));
                    continue;
                }
            }

            std::string key = arg;

            // Check if this is a flag (no value) or key-value pair
            if (i + 1 < argc && argv[i + 1][0] != '-') {
                opts_[key].push_back(argv[i + 1]);
                i++;
            } else {
                opts_[key].push_back("1");
            }
        } else {
            positional_.push_back(arg);
        }
    }
}

bool CliParser::has(const std::string& key) const {
    return opts_.count(key) > 0;
}

std::string CliParser::get_string(const std::string& key,
                                   const std::string& default_val) const {
    auto it = opts_.find(key);
    if (it != opts_.end() && !it->second.empty()) return it->second.back();
    return default_val;
}

bool CliParser::get_int_checked(const std::string& key, int default_val,
                                int& out) const {
    auto it = opts_.find(key);
    if (it == opts_.end() || it->second.empty()) {
        out = default_val;
        return true;
    }
    const std::string& s = it->second.back();
    try {
        size_t pos = 0;
        int v = std::stoi(s, &pos);
        if (pos != s.size()) return false;
        out = v;
        return true;
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }
}

} // namespace contigsift
