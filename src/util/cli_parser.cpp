#include "util/cli_parser.hpp"

#include <cstdlib>
#include <stdexcept>

namespace ednakmer {

// A value may itself start with '-' when it is a number ("-min_score -1")
// or the stdin/stdout path "-".
static bool looks_like_value(const char* arg) {
    if (arg[0] != '-' || arg[1] == '\0') return true;
    char* end = nullptr;
    std::strtod(arg, &end);
    return end != arg && *end == '\0';
}

CliParser::CliParser(int argc, char* argv[]) {
    if (argc > 0) {
        program_ = argv[0];
    }

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg.size() >= 2 && arg[0] == '-') {
            // --key=value
            if (arg.size() >= 3 && arg[1] == '-') {
                auto eq = arg.find('=');
                if (eq != std::string::npos) {
                    opts_[arg.substr(0, eq)].push_back(arg.substr(eq + 1));
                    continue;
                }
            }

            if (i + 1 < argc && looks_like_value(argv[i + 1])) {
                opts_[arg].push_back(argv[i + 1]);
                i++;
            } else {
                opts_[arg].push_back("1");
            }
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

bool CliParser::get_int(const std::string& key, int default_val, int& out,
                        std::string& error_msg) const {
    auto it = opts_.find(key);
    if (it == opts_.end() || it->second.empty()) {
        out = default_val;
        return true;
    }
    const std::string& s = it->second.back();
    try {
        size_t used = 0;
        int v = std::stoi(s, &used);
        if (used != s.size()) {
            error_msg = key + ": '" + s + "' is not an integer";
            return false;
        }
        out = v;
        return true;
    } catch (const std::logic_error&) {
        error_msg = key + ": '" + s + "' is not an integer";
        return false;
    }
}

bool CliParser::get_double(const std::string& key, double default_val, double& out,
                           std::string& error_msg) const {
    auto it = opts_.find(key);
    if (it == opts_.end() || it->second.empty()) {
        out = default_val;
        return true;
    }
    const std::string& s = it->second.back();
    try {
        size_t used = 0;
        double v = std::stod(s, &used);
        if (used != s.size()) {
            error_msg = key + ": '" + s + "' is not a number";
            return false;
        }
        out = v;
        return true;
    } catch (const std::logic_error&) {
        error_msg = key + ": '" + s + "' is not a number";
        return false;
    }
}

} // namespace ednakmer
