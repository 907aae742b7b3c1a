#pragma once

#include <cstdint>
#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>

#include "core/types.hpp"

namespace ednakmer {

class KmerScanner;

// Frequency multiset over k-mers drawn from the {A,C,G,T} alphabet.
// k-mers up to MAX_PACKED_K bases live in counts() as packed values; longer
// ones live in long_counts() keyed by their uppercase bases. A profile built
// with one scanner only ever fills one of the two maps.
class KmerProfile {
public:
    using CountMap = std::unordered_map<Kmer, uint32_t>;
    using LongCountMap = std::unordered_map<std::string, uint32_t>;

    KmerProfile() = default;

    // Build a profile from a single sequence.
    static KmerProfile from_sequence(std::string_view seq, const KmerScanner& scanner);

    // Add every valid k-mer of seq. Returns the number of k-mer occurrences added.
    uint64_t add_sequence(std::string_view seq, const KmerScanner& scanner);

    void add(Kmer kmer, uint32_t count = 1);
    void add(const std::string& bases, uint32_t count = 1);

    // Occurrence count of kmer (0 if absent).
    uint32_t count(Kmer kmer) const;
    uint32_t count(const std::string& bases) const;

    bool contains(Kmer kmer) const { return counts_.count(kmer) > 0; }
    bool empty() const { return counts_.empty() && long_counts_.empty(); }

    // Number of distinct k-mers.
    size_t distinct() const { return counts_.size() + long_counts_.size(); }

    // Sum of all occurrence counts.
    uint64_t total() const { return total_; }

    const CountMap& counts() const { return counts_; }
    const LongCountMap& long_counts() const { return long_counts_; }

private:
    CountMap counts_;
    LongCountMap long_counts_;
    uint64_t total_ = 0;
};

} // namespace ednakmer
