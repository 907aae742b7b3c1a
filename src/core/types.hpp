#pragma once

#include <cstdint>
#include <string>

#include "core/config.hpp"

namespace ednakmer {

using SpeciesId = std::string;
using Kmer = uint64_t;

enum class ConfidenceLevel { kHigh, kMedium, kLow, kVeryLow };

struct ReferenceRecord {
    SpeciesId species_id;
    std::string sequence;
};

// Taxonomic ranks reported with a match; "Unknown" where not recorded.
struct TaxonomyRanks {
    std::string kingdom;
    std::string class_name;
    std::string order;
    std::string family;
    std::string genus;
};

struct ScoredMatch {
    SpeciesId species_id;
    std::string scientific_name;
    std::string common_name;
    std::string phylum;
    TaxonomyRanks taxonomy;
    double matching_score = 0.0;       // [0,100]; reported with 2 decimals
    ConfidenceLevel confidence_level = ConfidenceLevel::kVeryLow;
    uint32_t query_length = 0;         // length of the query as supplied
    uint32_t query_kmer_count = 0;     // distinct k-mers in the query
};

// Score floor and result limit for one match call.
struct MatchConfig {
    int top_n = DEFAULT_TOP_N;
    double min_score = DEFAULT_MIN_SCORE;
};

// Returns true if config is usable. On failure, sets error_msg.
inline bool validate_match_config(const MatchConfig& config,
                                  std::string& error_msg) {
    if (config.top_n <= 0) {
        error_msg = "top_n must be positive (got " +
                    std::to_string(config.top_n) + ")";
        return false;
    }
    if (!(config.min_score >= 0.0 && config.min_score <= 100.0)) {
        error_msg = "min_score must be within [0, 100] (got " +
                    std::to_string(config.min_score) + ")";
        return false;
    }
    return true;
}

} // namespace ednakmer
