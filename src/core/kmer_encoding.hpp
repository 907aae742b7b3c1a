#pragma once

#include <cctype>
#include <cstdint>
#include <cstddef>
#include <string>
#include <string_view>

#include "core/config.hpp"
#include "core/types.hpp"

namespace ednakmer {

// 256-element LUT: char -> 2-bit encoding. 0xFF = invalid (N, etc.)
inline constexpr uint8_t BASE_ENCODE_INVALID = 0xFF;

inline const uint8_t* base_encode_table() {
    static const uint8_t table[256] = {
        // 0x00-0x3F
        0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,
        0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,
        0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,
        0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,
        // 0x40-0x5F: @ABCDEFGHIJKLMNOPQRSTUVWXYZ[\]^_
        0xFF,0x00,0xFF,0x01,0xFF,0xFF,0xFF,0x02,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,
        0xFF,0xFF,0xFF,0xFF,0x03,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,
        // 0x60-0x7F: `abcdefghijklmnopqrstuvwxyz{|}~DEL
        0xFF,0x00,0xFF,0x01,0xFF,0xFF,0xFF,0x02,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,
        0xFF,0xFF,0xFF,0xFF,0x03,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,
        // 0x80-0xFF
        0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,
        0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,
        0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,
        0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,
        0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,
        0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,
        0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,
        0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,
    };
    return table;
}

inline uint8_t encode_base(char c) {
    return base_encode_table()[static_cast<uint8_t>(c)];
}

// Inverse of encode_base (uppercase).
inline char decode_base(uint8_t enc) {
    static const char bases[4] = {'A', 'C', 'G', 'T'};
    return bases[enc & 0x03];
}

// Decode a packed k-mer back to its base string.
inline std::string decode_kmer(Kmer kmer, int k) {
    std::string s(static_cast<size_t>(k), 'A');
    for (int i = k - 1; i >= 0; i--) {
        s[static_cast<size_t>(i)] = decode_base(static_cast<uint8_t>(kmer & 0x03));
        kmer >>= 2;
    }
    return s;
}

// Bases accepted by the upstream query validator: A,C,G,T,N in either case.
inline bool is_query_base(char c) {
    switch (c) {
        case 'A': case 'C': case 'G': case 'T': case 'N':
        case 'a': case 'c': case 'g': case 't': case 'n':
            return true;
        default:
            return false;
    }
}

// Returns true if seq only contains A,C,G,T,N (case-insensitive).
// On failure, error_msg names the first offending character and its position.
inline bool validate_query_bases(std::string_view seq, std::string& error_msg) {
    for (size_t i = 0; i < seq.size(); i++) {
        if (!is_query_base(seq[i])) {
            error_msg = "invalid base '" + std::string(1, seq[i]) +
                        "' at position " + std::to_string(i) +
                        " (allowed: A, T, G, C, N)";
            return false;
        }
    }
    return true;
}

// Strip leading and trailing whitespace.
inline std::string_view trim_sequence(std::string_view seq) {
    size_t start = 0;
    while (start < seq.size() && std::isspace(static_cast<unsigned char>(seq[start])))
        start++;
    size_t end = seq.size();
    while (end > start && std::isspace(static_cast<unsigned char>(seq[end - 1])))
        end--;
    return seq.substr(start, end - start);
}

// Sliding window k-mer scanner with invalid-base counter.
// Case-insensitive; any window touching a non-ACGT character is skipped.
// scan() calls callback(pos, kmer) for each valid packed k-mer and needs
// packed(); scan_long() calls callback(pos, bases) with the uppercase window
// and works for any k.
class KmerScanner {
public:
    explicit KmerScanner(int k) : k_(k), mask_(kmer_mask(k)) {}

    int k() const { return k_; }
    bool packed() const { return packed_k(k_); }

    template <typename Callback>
    void scan(std::string_view seq, Callback&& callback) const {
        seq = trim_sequence(seq);
        size_t len = seq.size();
        if (len < static_cast<size_t>(k_)) return;

        Kmer kmer = 0;
        int n_count = k_ - 1; // need k valid bases before first k-mer

        for (size_t i = 0; i < len; i++) {
            uint8_t enc = encode_base(seq[i]);
            if (enc == BASE_ENCODE_INVALID) {
                n_count = k_ - 1;
                kmer = 0;
                continue;
            }
            kmer = ((kmer << 2) | static_cast<Kmer>(enc)) & mask_;
            if (n_count > 0) {
                n_count--;
                continue;
            }
            // Position of k-mer start = i - k + 1
            callback(static_cast<uint32_t>(i - k_ + 1), kmer);
        }
    }

    template <typename Callback>
    void scan_long(std::string_view seq, Callback&& callback) const {
        seq = trim_sequence(seq);
        size_t len = seq.size();
        size_t k = static_cast<size_t>(k_);
        if (len < k) return;

        std::string upper(seq);
        std::string_view view(upper);
        size_t run = 0; // valid bases ending at i

        for (size_t i = 0; i < len; i++) {
            uint8_t enc = encode_base(seq[i]);
            if (enc == BASE_ENCODE_INVALID) {
                run = 0;
                continue;
            }
            upper[i] = decode_base(enc);
            if (++run < k) continue;
            callback(static_cast<uint32_t>(i - k + 1), view.substr(i - k + 1, k));
        }
    }

private:
    int k_;
    Kmer mask_;
};

} // namespace ednakmer
