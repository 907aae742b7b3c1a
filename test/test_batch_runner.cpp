#include "test_util.hpp"
#include "index/index_builder.hpp"
#include "index/species_metadata.hpp"
#include "io/batch_reader.hpp"
#include "io/fasta_reader.hpp"
#include "io/taxonomy_reader.hpp"
#include "search/batch_runner.hpp"
#include "search/sequence_matcher.hpp"
#include "util/logger.hpp"

#include <string>
#include <vector>

using namespace ednakmer;

static ReferenceIndexPtr build_testdata_index() {
    std::vector<ReferenceRecord> corpus;
    MetadataTable taxonomy;
    std::string err;
    CHECK(read_reference_fasta(testdata_path("reference.fa"), corpus, err));
    CHECK(read_taxonomy(testdata_path("taxonomy.tsv"), taxonomy, err));
    Logger logger(Logger::kError);
    return build_reference_index(corpus, taxonomy, IndexBuilderConfig(), logger, err);
}

static BatchQuery query(const std::string& id, const std::string& seq,
                        const std::string& expected = {}) {
    BatchQuery q;
    q.id = id;
    q.sequence = seq;
    if (!expected.empty()) q.expected_species = expected;
    return q;
}

static void test_batch_independence() {
    std::fprintf(stderr, "-- test_batch_independence\n");
    Logger logger(Logger::kError);
    std::string err;
    std::vector<ReferenceRecord> corpus = {{"sp_001", "ATGCGATCG"}, {"sp_002", "CGATCGATT"}};
    SequenceMatcher matcher(build_reference_index(corpus, MetadataTable(),
                                                  IndexBuilderConfig(), logger, err));

    std::vector<BatchQuery> queries = {
        query("q1", "ATGCGATCG"),
        query("q2", ""),
        query("q3", "CGATCGATT"),
        query("q4", "AAAAAAAAAAA"),
        query("q5", "   "),
    };

    BatchConfig config;
    config.threads = 4;
    BatchResult result;
    CHECK(run_batch(matcher, queries, config, result, logger, err));
    CHECK_EQ(result.items.size(), 5u);

    CHECK_STR_EQ(result.items[0].id, "q1");
    CHECK_EQ(result.items[0].matches.size(), 1u);
    CHECK(!result.items[0].failed());

    CHECK(result.items[1].failed());
    CHECK_STR_EQ(result.items[1].error, "Empty sequence");
    CHECK(result.items[1].matches.empty());

    CHECK_EQ(result.items[2].matches.size(), 1u);
    if (!result.items[2].matches.empty()) {
        CHECK_STR_EQ(result.items[2].matches[0].species_id, "sp_002");
    }

    // No match above the floor is not an error
    CHECK(!result.items[3].failed());
    CHECK(result.items[3].matches.empty());

    CHECK(result.items[4].failed());

    // No-match queries count as failed, alongside the error markers
    CHECK_EQ(result.stats.total, 5u);
    CHECK_EQ(result.stats.successful, 2u);
    CHECK_EQ(result.stats.failed, 3u);
    CHECK_EQ(result.stats.errors, 2u);
    CHECK_NEAR(result.stats.success_rate(), 40.0, 1e-9);
    CHECK(!result.stats.has_accuracy());
    CHECK_NEAR(result.stats.accuracy(), 0.0, 1e-12);

    const BatchItemResult* q3 = result.find("q3");
    CHECK(q3 != nullptr);
    CHECK(result.find("nope") == nullptr);
}

static void test_accuracy_from_json() {
    std::fprintf(stderr, "-- test_accuracy_from_json\n");
    Logger logger(Logger::kError);
    std::string err;
    SequenceMatcher matcher(build_testdata_index());

    std::vector<BatchQuery> queries;
    CHECK(read_batch_json(testdata_path("test_sequences.json"), queries, err));
    CHECK_EQ(queries.size(), 6u);

    BatchConfig config;
    config.threads = 2;
    BatchResult result;
    CHECK(run_batch(matcher, queries, config, result, logger, err));
    CHECK_EQ(result.items.size(), 6u);

    // T1..T3 identify their species, T4 is empty, T5 matches nothing
    const char* expected_top[] = {"SP001", "SP002", "SP003"};
    for (int i = 0; i < 3; i++) {
        CHECK_EQ(result.items[i].matches.size(), 1u);
        if (!result.items[i].matches.empty()) {
            CHECK_STR_EQ(result.items[i].matches[0].species_id, expected_top[i]);
        }
    }
    CHECK(result.items[3].failed());
    CHECK(result.items[4].matches.empty());
    CHECK_STR_EQ(result.items[5].id, "seq_6");
    // Length after trimming the surrounding blanks and newline
    CHECK_EQ(result.items[5].sequence_length, 60u);
    if (!result.items[5].matches.empty()) {
        CHECK_EQ(result.items[5].matches[0].query_length, 63u);
    }
    if (!result.items[5].matches.empty()) {
        CHECK(result.items[5].matches[0].matching_score == 100.0);
    }

    const BatchStats& st = result.stats;
    CHECK_EQ(st.total, 6u);
    CHECK_EQ(st.successful, 4u);
    CHECK_EQ(st.failed, 2u);
    CHECK_EQ(st.errors, 1u);
    CHECK_NEAR(st.success_rate(), 400.0 / 6.0, 1e-9);
    CHECK_EQ(st.with_expectation, 5u);
    CHECK_EQ(st.correct, 3u);
    CHECK(st.has_accuracy());
    CHECK_NEAR(st.accuracy(), 60.0, 1e-9);
}

static void test_thread_counts_agree() {
    std::fprintf(stderr, "-- test_thread_counts_agree\n");
    Logger logger(Logger::kError);
    std::string err;
    SequenceMatcher matcher(build_testdata_index());

    std::vector<BatchQuery> queries;
    CHECK(read_batch_json(testdata_path("test_sequences.json"), queries, err));
    // Repeat the set to give the workers something to split
    std::vector<BatchQuery> many;
    for (int r = 0; r < 20; r++) {
        for (const auto& q : queries) {
            BatchQuery c = q;
            c.id = q.id + "_" + std::to_string(r);
            many.push_back(c);
        }
    }

    BatchConfig serial;
    serial.threads = 1;
    BatchConfig parallel;
    parallel.threads = 8;
    BatchResult a, b;
    CHECK(run_batch(matcher, many, serial, a, logger, err));
    CHECK(run_batch(matcher, many, parallel, b, logger, err));
    CHECK_EQ(a.items.size(), b.items.size());
    for (size_t i = 0; i < a.items.size() && i < b.items.size(); i++) {
        CHECK_STR_EQ(a.items[i].id, b.items[i].id);
        CHECK_EQ(a.items[i].matches.size(), b.items[i].matches.size());
        for (size_t j = 0; j < a.items[i].matches.size() && j < b.items[i].matches.size(); j++) {
            CHECK(a.items[i].matches[j].species_id == b.items[i].matches[j].species_id);
            CHECK(a.items[i].matches[j].matching_score == b.items[i].matches[j].matching_score);
        }
    }
    CHECK_EQ(a.stats.correct, b.stats.correct);
    CHECK_EQ(a.stats.with_expectation, 100u);
}

static void test_metadata_passthrough() {
    std::fprintf(stderr, "-- test_metadata_passthrough\n");
    Logger logger(Logger::kError);
    std::string err;
    SequenceMatcher matcher(build_testdata_index());

    std::vector<BatchQuery> queries = {query("with", "ACGTACGTAC"), query("empty", ""),
                                       query("none", "ACGTACGTAC")};
    queries[0].metadata["sample_location"] = "Location A";
    queries[1].metadata["depth_m"] = 12;

    BatchResult result;
    CHECK(run_batch(matcher, queries, BatchConfig(), result, logger, err));
    CHECK_EQ(result.items.size(), 3u);
    if (result.items.size() != 3) return;
    CHECK_STR_EQ(result.items[0].metadata["sample_location"].asString(), "Location A");
    // Error items keep their metadata too
    CHECK(result.items[1].failed());
    CHECK_EQ(result.items[1].metadata["depth_m"].asInt(), 12);
    CHECK(result.items[2].metadata.isNull());
}

static void test_default_ids_and_config() {
    std::fprintf(stderr, "-- test_default_ids_and_config\n");
    CHECK_STR_EQ(default_query_id(0), "seq_1");
    CHECK_STR_EQ(default_query_id(41), "seq_42");

    Logger logger(Logger::kError);
    std::string err;
    SequenceMatcher matcher(build_testdata_index());
    std::vector<BatchQuery> queries = {query("", "ACGTACGTAC"), query("", "")};

    BatchConfig config;
    BatchResult result;
    CHECK(run_batch(matcher, queries, config, result, logger, err));
    CHECK_STR_EQ(result.items[0].id, "seq_1");
    CHECK_STR_EQ(result.items[1].id, "seq_2");

    config.match.top_n = 0;
    CHECK(!run_batch(matcher, queries, config, result, logger, err));
    CHECK(!err.empty());
    CHECK(result.items.empty());
}

static void test_empty_batch() {
    std::fprintf(stderr, "-- test_empty_batch\n");
    Logger logger(Logger::kError);
    std::string err;
    SequenceMatcher matcher(build_testdata_index());
    BatchResult result;
    CHECK(run_batch(matcher, {}, BatchConfig(), result, logger, err));
    CHECK(result.items.empty());
    CHECK_EQ(result.stats.total, 0u);
    CHECK_NEAR(result.stats.success_rate(), 0.0, 1e-12);
}

int main() {
    test_batch_independence();
    test_accuracy_from_json();
    test_thread_counts_agree();
    test_metadata_passthrough();
    test_default_ids_and_config();
    test_empty_batch();
    TEST_SUMMARY();
    return g_fail_count > 0 ? 1 : 0;
}
