#pragma once

#include <cstdint>
#include <cstddef>

namespace ednakmer {

// k-mer length limits. Up to MAX_PACKED_K bases a k-mer is packed 2 bits per
// base into uint64_t; longer k-mers are keyed by their uppercase bases.
inline constexpr int MIN_K = 1;
inline constexpr int MAX_PACKED_K = 32;
inline constexpr int DEFAULT_K = 5;

// Matching defaults
inline constexpr double DEFAULT_MIN_SCORE = 50.0;
inline constexpr int DEFAULT_TOP_N = 5;
inline constexpr int MAX_TOP_N = 20;          // cap applied by the CLI
inline constexpr size_t MAX_BATCH_QUERIES = 50;

// Score blend for queries sharing at least one k-mer with the reference
inline constexpr double JACCARD_WEIGHT = 0.7;
inline constexpr double FREQUENCY_WEIGHT = 0.3;

// Confidence thresholds (inclusive lower bounds)
inline constexpr double HIGH_CONFIDENCE_SCORE = 85.0;
inline constexpr double MEDIUM_CONFIDENCE_SCORE = 70.0;
inline constexpr double LOW_CONFIDENCE_SCORE = 50.0;

// Mask for k-mer of given k: (1 << 2k) - 1
inline constexpr uint64_t kmer_mask(int k) {
    return k >= 32 ? ~uint64_t(0) : (uint64_t(1) << (2 * k)) - 1;
}

inline constexpr bool valid_k(int k) {
    return k >= MIN_K;
}

inline constexpr bool packed_k(int k) {
    return k <= MAX_PACKED_K;
}

} // namespace ednakmer
