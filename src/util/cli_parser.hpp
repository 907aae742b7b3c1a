#pragma once

#include <string>
#include <unordered_map>
#include <vector>

namespace ednakmer {

// Command-line parser for -key value style arguments.
// A key followed by another -key (or nothing) is a flag with value "1".
// --key=value is accepted for double-dash keys. Bare words are ignored.
class CliParser {
public:
    CliParser(int argc, char* argv[]);

    // Check if a flag/option is present.
    bool has(const std::string& key) const;

    // Last value given for key, or default_val if absent.
    std::string get_string(const std::string& key,
                           const std::string& default_val = {}) const;

    // Parse key as int. Absent -> default_val. Returns false and sets error_msg
    // if the value is not a whole integer.
    bool get_int(const std::string& key, int default_val, int& out,
                 std::string& error_msg) const;

    // Parse key as double. Absent -> default_val. Returns false and sets
    // error_msg if the value is not a number.
    bool get_double(const std::string& key, double default_val, double& out,
                    std::string& error_msg) const;

    const std::string& program() const { return program_; }

private:
    std::string program_;
    std::unordered_map<std::string, std::vector<std::string>> opts_;
};

} // namespace ednakmer
