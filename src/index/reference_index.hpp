#pragma once

#include <cstdint>
#include <cstddef>
#include <memory>
#include <unordered_map>
#include <vector>

#include "core/types.hpp"
#include "index/kmer_profile.hpp"
#include "index/species_metadata.hpp"

namespace ednakmer {

// One species in the reference index.
struct IndexedSpecies {
    SpeciesMetadata metadata;
    KmerProfile profile;          // k-mer counts summed over all sequences
    uint32_t num_sequences = 0;   // reference sequences seen for this species
};

// Immutable species_id -> k-mer profile index.
// Species are kept in corpus discovery order; lookups by id go through a
// side table of positions. Built by ReferenceIndexBuilder, then shared
// read-only (std::shared_ptr<const ReferenceIndex>) between matchers.
class ReferenceIndex {
public:
    // Construction is reserved to ReferenceIndexBuilder.
    class BuildKey {
        friend class ReferenceIndexBuilder;
        BuildKey() {}
    };

    ReferenceIndex(BuildKey, int k) : k_(k) {}

    int k() const { return k_; }

    size_t num_species() const { return species_.size(); }
    bool empty() const { return species_.empty(); }

    // Species in discovery order.
    const std::vector<IndexedSpecies>& species() const { return species_; }

    // nullptr if species_id is not indexed.
    const IndexedSpecies* find(const SpeciesId& species_id) const;

    // Metadata lookup; "Unknown" record if species_id is not indexed.
    SpeciesMetadata metadata(const SpeciesId& species_id) const;

    uint64_t num_sequences() const { return num_sequences_; }

    // Sum over species of distinct k-mers per profile.
    uint64_t total_distinct_kmers() const { return total_distinct_; }

    // Sum over species of k-mer occurrences.
    uint64_t total_kmers() const { return total_kmers_; }

private:
    friend class ReferenceIndexBuilder;

    int k_;
    std::vector<IndexedSpecies> species_;
    std::unordered_map<SpeciesId, size_t> positions_;
    uint64_t num_sequences_ = 0;
    uint64_t total_distinct_ = 0;
    uint64_t total_kmers_ = 0;
};

using ReferenceIndexPtr = std::shared_ptr<const ReferenceIndex>;

} // namespace ednakmer
