#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <json/json.h>

#include "core/types.hpp"

namespace ednakmer {

class Logger;
class SequenceMatcher;

// One named query of a batch.
struct BatchQuery {
    std::string id;
    std::string sequence;
    std::string description;                  // free text, reporting only
    std::optional<SpeciesId> expected_species; // ground truth for accuracy
    Json::Value metadata;                      // caller data echoed in the result
};

struct BatchItemResult {
    std::string id;
    std::vector<ScoredMatch> matches;
    std::string error;       // empty unless the query itself was unusable
    uint32_t sequence_length = 0;  // after trimming surrounding whitespace
    Json::Value metadata;          // copied from the query

    bool failed() const { return !error.empty(); }
};

struct BatchStats {
    size_t total = 0;             // queries processed
    size_t successful = 0;        // queries with at least one match
    size_t failed = 0;            // total - successful (errors and no match)
    size_t errors = 0;            // queries with an error marker
    size_t with_expectation = 0;  // queries carrying expected_species
    size_t correct = 0;           // top match equals expected_species

    // successful / total * 100; 0 for an empty batch.
    double success_rate() const {
        if (total == 0) return 0.0;
        return static_cast<double>(successful) / static_cast<double>(total) * 100.0;
    }

    bool has_accuracy() const { return with_expectation > 0; }

    // correct / with_expectation * 100; 0 when no query carries an expectation.
    double accuracy() const {
        if (with_expectation == 0) return 0.0;
        return static_cast<double>(correct) / static_cast<double>(with_expectation) * 100.0;
    }
};

struct BatchResult {
    std::vector<BatchItemResult> items;  // same order as the input queries
    BatchStats stats;

    // First item with the given id, nullptr if absent.
    const BatchItemResult* find(const std::string& id) const;
};

struct BatchConfig {
    MatchConfig match;
    int threads = 1;
};

// Match every query independently. An unusable query (empty sequence) gets an
// error marker; it never stops the rest of the batch.
// Returns false and sets error_msg only if config.match is invalid.
bool run_batch(const SequenceMatcher& matcher,
               const std::vector<BatchQuery>& queries,
               const BatchConfig& config,
               BatchResult& result,
               const Logger& logger,
               std::string& error_msg);

// Generated id for the i-th (0-based) query lacking one: "seq_<i+1>".
std::string default_query_id(size_t index);

} // namespace ednakmer
