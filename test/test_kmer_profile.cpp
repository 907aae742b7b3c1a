#include "test_util.hpp"
#include "core/kmer_encoding.hpp"
#include "index/kmer_profile.hpp"

#include <string>

using namespace ednakmer;

static Kmer kmer_of(const std::string& s) {
    Kmer v = 0;
    for (char c : s) v = (v << 2) | encode_base(c);
    return v;
}

static void test_counts_and_distinct() {
    KmerScanner scanner(5);
    // AAAAAAA -> AAAAA x3
    KmerProfile p = KmerProfile::from_sequence("AAAAAAA", scanner);
    CHECK_EQ(p.distinct(), 1u);
    CHECK_EQ(p.total(), 3u);
    CHECK_EQ(p.count(kmer_of("AAAAA")), 3u);
    CHECK_EQ(p.count(kmer_of("CCCCC")), 0u);
    CHECK(p.contains(kmer_of("AAAAA")));
}

static void test_accumulate_sequences() {
    KmerScanner scanner(5);
    KmerProfile p;
    CHECK_EQ(p.add_sequence("AAAAAAA", scanner), 3u);
    CHECK_EQ(p.add_sequence("aaaaa", scanner), 1u);
    CHECK_EQ(p.add_sequence("ATGCGATCG", scanner), 5u);
    CHECK_EQ(p.count(kmer_of("AAAAA")), 4u);
    CHECK_EQ(p.count(kmer_of("ATGCG")), 1u);
    CHECK_EQ(p.distinct(), 6u);
    CHECK_EQ(p.total(), 9u);
}

static void test_degenerate_sequences() {
    KmerScanner scanner(5);
    KmerProfile p;
    CHECK_EQ(p.add_sequence("", scanner), 0u);
    CHECK_EQ(p.add_sequence("ACG", scanner), 0u);
    CHECK_EQ(p.add_sequence("NNNNNNNN", scanner), 0u);
    CHECK(p.empty());
    CHECK_EQ(p.total(), 0u);
}

static void test_add_direct() {
    KmerProfile p;
    p.add(kmer_of("ACGTA"));
    p.add(kmer_of("ACGTA"), 2);
    p.add(kmer_of("CCCCC"), 0);
    CHECK_EQ(p.count(kmer_of("ACGTA")), 3u);
    CHECK_EQ(p.distinct(), 1u);
    CHECK_EQ(p.total(), 3u);
}

static void test_long_kmers() {
    KmerScanner scanner(33);
    std::string a33(33, 'A');
    KmerProfile p;
    // 35 A -> 3 windows of one 33-mer, lowercase folded in
    CHECK_EQ(p.add_sequence(std::string(35, 'A'), scanner), 3u);
    CHECK_EQ(p.add_sequence(std::string(33, 'a'), scanner), 1u);
    CHECK_EQ(p.add_sequence(std::string(16, 'A') + "N" + std::string(16, 'A'), scanner), 0u);
    CHECK_EQ(p.count(a33), 4u);
    CHECK_EQ(p.distinct(), 1u);
    CHECK_EQ(p.total(), 4u);
    CHECK(p.counts().empty());
    CHECK_EQ(p.long_counts().size(), 1u);

    p.add(std::string(33, 'C'), 2);
    CHECK_EQ(p.count(std::string(33, 'C')), 2u);
    CHECK_EQ(p.distinct(), 2u);
    CHECK(!p.empty());
}

int main() {
    test_counts_and_distinct();
    test_accumulate_sequences();
    test_degenerate_sequences();
    test_add_direct();
    test_long_kmers();
    TEST_SUMMARY();
    return g_fail_count > 0 ? 1 : 0;
}
