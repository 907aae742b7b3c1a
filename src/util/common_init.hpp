#pragma once

#include "core/config.hpp"
#include "core/types.hpp"
#include "util/cli_parser.hpp"
#include "util/logger.hpp"

#include <algorithm>
#include <cstdio>
#include <string>
#include <thread>

// EDNAKMER_VERSION is defined in the generated core/version.hpp.
// Callers must include core/version.hpp before using check_version().

namespace ednakmer {

// Print "<cmd_name> <version>" to stderr if --version is present.
// Returns true if --version was handled (caller should return 0).
inline bool check_version(const CliParser& cli, const char* cmd_name) {
    if (cli.has("--version")) {
        std::fprintf(stderr, "%s %s\n", cmd_name, EDNAKMER_VERSION);
        return true;
    }
    return false;
}

// Create a Logger from -v / --verbose flags.
inline Logger make_logger(const CliParser& cli, const char* cmd_name) {
    bool verbose = cli.has("-v") || cli.has("--verbose");
    return Logger(verbose ? Logger::kDebug : Logger::kInfo, cmd_name);
}

// Resolve thread count from CLI (0 or negative -> hardware_concurrency).
inline int resolve_threads(const CliParser& cli,
                           const std::string& key = "-threads") {
    std::string ignored;
    int n = 0;
    if (!cli.get_int(key, 0, n, ignored) || n <= 0) {
        n = static_cast<int>(std::thread::hardware_concurrency());
        if (n <= 0) n = 1;
    }
    return n;
}

// Read -k, -top_n and -min_score. top_n above MAX_TOP_N is capped with a
// warning. Returns false and sets error_msg on unparsable or invalid values.
inline bool load_match_options(const CliParser& cli, const Logger& logger,
                               int& k, MatchConfig& config,
                               std::string& error_msg) {
    if (!cli.get_int("-k", DEFAULT_K, k, error_msg)) return false;
    if (!valid_k(k)) {
        error_msg = "-k must be at least " + std::to_string(MIN_K) +
                    " (got " + std::to_string(k) + ")";
        return false;
    }
    if (!cli.get_int("-top_n", DEFAULT_TOP_N, config.top_n, error_msg)) return false;
    if (!cli.get_double("-min_score", DEFAULT_MIN_SCORE, config.min_score, error_msg))
        return false;
    if (!validate_match_config(config, error_msg)) return false;
    if (config.top_n > MAX_TOP_N) {
        logger.warn("-top_n %d capped at %d", config.top_n, MAX_TOP_N);
        config.top_n = std::min(config.top_n, MAX_TOP_N);
    }
    return true;
}

} // namespace ednakmer
