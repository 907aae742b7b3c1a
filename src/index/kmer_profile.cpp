#include "index/kmer_profile.hpp"
#include "core/kmer_encoding.hpp"

namespace ednakmer {

KmerProfile KmerProfile::from_sequence(std::string_view seq,
                                       const KmerScanner& scanner) {
    KmerProfile profile;
    profile.add_sequence(seq, scanner);
    return profile;
}

uint64_t KmerProfile::add_sequence(std::string_view seq,
                                   const KmerScanner& scanner) {
    uint64_t added = 0;
    if (scanner.packed()) {
        scanner.scan(seq, [this, &added](uint32_t /*pos*/, Kmer kmer) {
            counts_[kmer]++;
            added++;
        });
    } else {
        scanner.scan_long(seq, [this, &added](uint32_t /*pos*/, std::string_view bases) {
            long_counts_[std::string(bases)]++;
            added++;
        });
    }
    total_ += added;
    return added;
}

void KmerProfile::add(Kmer kmer, uint32_t count) {
    if (count == 0) return;
    counts_[kmer] += count;
    total_ += count;
}

void KmerProfile::add(const std::string& bases, uint32_t count) {
    if (count == 0) return;
    long_counts_[bases] += count;
    total_ += count;
}

uint32_t KmerProfile::count(Kmer kmer) const {
    auto it = counts_.find(kmer);
    return it == counts_.end() ? 0 : it->second;
}

uint32_t KmerProfile::count(const std::string& bases) const {
    auto it = long_counts_.find(bases);
    return it == long_counts_.end() ? 0 : it->second;
}

} // namespace ednakmer
