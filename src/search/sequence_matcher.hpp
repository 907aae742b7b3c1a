#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "core/kmer_encoding.hpp"
#include "core/types.hpp"
#include "index/kmer_profile.hpp"
#include "index/reference_index.hpp"

namespace ednakmer {

// Components of one query/reference comparison.
struct ScoreBreakdown {
    uint32_t common = 0;      // distinct k-mers present in both profiles
    uint32_t union_size = 0;  // distinct k-mers present in either profile
    double jaccard = 0.0;     // common / union * 100
    double frequency = 0.0;   // mean min/max count ratio over common k-mers * 100
    double score = 0.0;       // 0.7 * jaccard + 0.3 * frequency, or jaccard alone
};

// Compare two k-mer profiles.
// With no common k-mer the score is the Jaccard component alone (0).
ScoreBreakdown score_profiles(const KmerProfile& query, const KmerProfile& reference);

// Round a score to 2 decimals for reporting (ties away from zero).
double round_score(double score);

// Scores query sequences against every species of a shared ReferenceIndex.
// match() is const and touches no mutable state, so one SequenceMatcher
// may serve any number of threads.
class SequenceMatcher {
public:
    explicit SequenceMatcher(ReferenceIndexPtr index);

    const ReferenceIndex& index() const { return *index_; }

    // Query k-mer profile, extracted with the index's k.
    KmerProfile query_profile(std::string_view query) const;

    // Rank species for one query.
    // out receives at most config.top_n matches with score >= config.min_score,
    // sorted by descending reported score; equal reported scores keep index
    // order.
    // A query without valid k-mers yields an empty list.
    // Returns false and sets error_msg only if config is invalid.
    bool match(std::string_view query, const MatchConfig& config,
               std::vector<ScoredMatch>& out, std::string& error_msg) const;

private:
    ReferenceIndexPtr index_;
    KmerScanner scanner_;
};

} // namespace ednakmer
