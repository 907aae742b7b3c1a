#include "search/sequence_matcher.hpp"
#include "core/config.hpp"
#include "core/confidence.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace ednakmer {

namespace {

// Walk the smaller map, probe the larger one.
template <typename Map>
void compare_counts(const Map& a, const Map& b, uint32_t& common, double& ratio_sum) {
    const Map& small = a.size() <= b.size() ? a : b;
    const Map& large = (&small == &a) ? b : a;
    for (const auto& kv : small) {
        auto it = large.find(kv.first);
        if (it == large.end()) continue;
        common++;
        uint32_t lo = std::min(kv.second, it->second);
        uint32_t hi = std::max(kv.second, it->second);
        ratio_sum += static_cast<double>(lo) / static_cast<double>(hi);
    }
}

} // namespace

ScoreBreakdown score_profiles(const KmerProfile& query, const KmerProfile& reference) {
    ScoreBreakdown sb;
    if (query.empty() || reference.empty()) return sb;

    uint32_t common = 0;
    double ratio_sum = 0.0;
    compare_counts(query.counts(), reference.counts(), common, ratio_sum);
    compare_counts(query.long_counts(), reference.long_counts(), common, ratio_sum);

    sb.common = common;
    sb.union_size = static_cast<uint32_t>(query.distinct() + reference.distinct() - common);
    if (sb.union_size == 0) return sb;

    sb.jaccard = static_cast<double>(common) / static_cast<double>(sb.union_size) * 100.0;
    if (common > 0) {
        sb.frequency = ratio_sum / static_cast<double>(common) * 100.0;
        sb.score = sb.jaccard * JACCARD_WEIGHT + sb.frequency * FREQUENCY_WEIGHT;
    } else {
        sb.score = sb.jaccard;
    }
    return sb;
}

double round_score(double score) {
    return std::round(score * 100.0) / 100.0;
}

SequenceMatcher::SequenceMatcher(ReferenceIndexPtr index)
    : index_(std::move(index)), scanner_(index_->k()) {}

KmerProfile SequenceMatcher::query_profile(std::string_view query) const {
    return KmerProfile::from_sequence(query, scanner_);
}

bool SequenceMatcher::match(std::string_view query, const MatchConfig& config,
                            std::vector<ScoredMatch>& out,
                            std::string& error_msg) const {
    out.clear();
    if (!validate_match_config(config, error_msg)) {
        return false;
    }

    KmerProfile qprof = query_profile(query);
    if (qprof.empty()) {
        return true;
    }

    const uint32_t query_length = static_cast<uint32_t>(query.size());
    const uint32_t query_kmers = static_cast<uint32_t>(qprof.distinct());

    for (const auto& sp : index_->species()) {
        // No valid reference k-mer: never a candidate, whatever the floor
        if (sp.profile.empty()) continue;

        ScoreBreakdown sb = score_profiles(qprof, sp.profile);
        if (sb.score < config.min_score) continue;

        ScoredMatch m;
        m.species_id = sp.metadata.species_id;
        m.scientific_name = sp.metadata.scientific_name;
        m.common_name = sp.metadata.common_name;
        m.phylum = sp.metadata.phylum;
        m.taxonomy = sp.metadata.ranks();
        m.matching_score = sb.score;
        m.confidence_level = classify_confidence(sb.score);
        m.query_length = query_length;
        m.query_kmer_count = query_kmers;
        out.push_back(std::move(m));
    }

    // Ranked on the reported (2-decimal) score; equal reported scores keep
    // index order.
    std::stable_sort(out.begin(), out.end(),
                     [](const ScoredMatch& a, const ScoredMatch& b) {
                         return round_score(a.matching_score) > round_score(b.matching_score);
                     });

    if (out.size() > static_cast<size_t>(config.top_n)) {
        out.resize(static_cast<size_t>(config.top_n));
    }
    return true;
}

} // namespace ednakmer
