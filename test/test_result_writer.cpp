#include "test_util.hpp"
#include "io/result_writer.hpp"
#include "core/confidence.hpp"
#include "index/species_metadata.hpp"

#include <sstream>
#include <string>

using namespace ednakmer;

static bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

static ScoredMatch make_match(const std::string& id, const std::string& sci,
                              const std::string& common, double score) {
    ScoredMatch m;
    m.species_id = id;
    m.scientific_name = sci;
    m.common_name = common;
    m.phylum = "Chordata";
    m.taxonomy.kingdom = "Animalia";
    m.taxonomy.class_name = "Actinopterygii";
    m.taxonomy.order = UNKNOWN_FIELD;
    m.taxonomy.family = "Scombridae";
    m.taxonomy.genus = "Thunnus";
    m.matching_score = score;
    m.confidence_level = classify_confidence(score);
    m.query_length = 45;
    m.query_kmer_count = 41;
    return m;
}

static BatchResult sample_result(bool with_expectation) {
    BatchResult r;
    BatchItemResult ok;
    ok.id = "T1";
    ok.sequence_length = 45;
    ok.metadata["sample_location"] = "Location A";
    ok.matches.push_back(make_match("SP001", "Thunnus albacares", "Yellowfin tuna", 84.996));
    ok.matches.push_back(make_match("SP002", "Delphinus \"delphis\"", "Common dolphin", 51.0));
    r.items.push_back(ok);

    BatchItemResult bad;
    bad.id = "T2";
    bad.error = "Empty sequence";
    bad.metadata["depth_m"] = 12;
    r.items.push_back(bad);

    BatchItemResult none;
    none.id = "T3";
    none.sequence_length = 12;
    r.items.push_back(none);

    r.stats.total = 3;
    r.stats.successful = 1;
    r.stats.failed = 2;
    r.stats.errors = 1;
    if (with_expectation) {
        r.stats.with_expectation = 3;
        r.stats.correct = 1;
    }
    return r;
}

static void test_tab_output() {
    std::fprintf(stderr, "-- test_tab_output\n");
    std::ostringstream out;
    write_results_tab(out, sample_result(false));
    std::string s = out.str();

    CHECK(s.rfind("# query_id\trank\tspecies_id\t", 0) == 0);
    // Score printed rounded; confidence from the unrounded value
    CHECK(contains(s, "T1\t1\tSP001\tThunnus albacares\tYellowfin tuna\tChordata\t85.00\tmedium\t45\t41\n"));
    CHECK(contains(s, "T1\t2\tSP002\t"));
    CHECK(contains(s, "\t51.00\tlow\t"));
    CHECK(contains(s, "# T2: Empty sequence\n"));
    CHECK(!contains(s, "T3\t"));
}

static void test_json_output() {
    std::fprintf(stderr, "-- test_json_output\n");
    std::ostringstream out;
    write_results(out, sample_result(true), OutputFormat::kJson);
    std::string s = out.str();

    CHECK(contains(s, "\"query_id\": \"T1\""));
    CHECK(contains(s, "\"matching_score\": 85.00"));
    CHECK(contains(s, "\"confidence_level\": \"medium\""));
    CHECK(contains(s, "\"scientific_name\": \"Delphinus \\\"delphis\\\"\""));
    CHECK(contains(s, "\"error\": \"Empty sequence\""));
    CHECK(contains(s, "\"total_matches\": 0"));
    CHECK(contains(s, "\"taxonomy\": {"));
    CHECK(contains(s, "\"kingdom\": \"Animalia\""));
    CHECK(contains(s, "\"class\": \"Actinopterygii\""));
    CHECK(contains(s, "\"order\": \"Unknown\""));
    CHECK(contains(s, "\"genus\": \"Thunnus\""));
    CHECK(contains(s, "\"metadata\": {\"sample_location\":\"Location A\"}"));
    CHECK(contains(s, "\"metadata\": {\"depth_m\":12}"));
    CHECK(contains(s, "\"total_sequences\": 3"));
    CHECK(contains(s, "\"failed_sequences\": 2"));
    CHECK(contains(s, "\"error_sequences\": 1"));
    CHECK(contains(s, "\"success_rate\": 33.33"));
    CHECK(contains(s, "\"with_expectation\": 3"));
    CHECK(contains(s, "\"accuracy\": 33.33"));

    std::ostringstream plain;
    write_results_json(plain, sample_result(false));
    CHECK(!contains(plain.str(), "accuracy"));
    // Only items that carry metadata get the member
    size_t first = plain.str().find("\"metadata\"");
    size_t second = plain.str().find("\"metadata\"", first + 1);
    CHECK(first != std::string::npos);
    CHECK(second != std::string::npos);
    CHECK(plain.str().find("\"metadata\"", second + 1) == std::string::npos);
}

static void test_match_report() {
    std::fprintf(stderr, "-- test_match_report\n");
    BatchResult r = sample_result(false);
    std::ostringstream out;
    write_match_report(out, "query", 45, r.items[0].matches);
    std::string s = out.str();
    CHECK(contains(s, "Matching results for query (length: 45)\n"));
    CHECK(contains(s, "  1. Yellowfin tuna (Thunnus albacares) [SP001]\n"));
    CHECK(contains(s, "     Score: 85.00% MEDIUM\n"));
    CHECK(contains(s, "     Phylum: Chordata\n"));
    CHECK(contains(s, "  2. Common dolphin"));

    std::ostringstream empty;
    write_match_report(empty, "q", 3, {});
    CHECK(contains(empty.str(), "No matches found above threshold"));
}

static void test_parse_output_format() {
    std::fprintf(stderr, "-- test_parse_output_format\n");
    OutputFormat fmt = OutputFormat::kTab;
    std::string err;
    CHECK(parse_output_format("json", fmt, err));
    CHECK(fmt == OutputFormat::kJson);
    CHECK(parse_output_format("tab", fmt, err));
    CHECK(fmt == OutputFormat::kTab);
    CHECK(!parse_output_format("xml", fmt, err));
    CHECK(fmt == OutputFormat::kTab);
    CHECK(contains(err, "xml"));
}

int main() {
    test_tab_output();
    test_json_output();
    test_match_report();
    test_parse_output_format();
    TEST_SUMMARY();
    return g_fail_count > 0 ? 1 : 0;
}
