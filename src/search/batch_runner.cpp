#include "search/batch_runner.hpp"
#include "search/sequence_matcher.hpp"
#include "core/kmer_encoding.hpp"
#include "util/logger.hpp"

#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <tbb/task_arena.h>

namespace ednakmer {

const BatchItemResult* BatchResult::find(const std::string& id) const {
    for (const auto& item : items) {
        if (item.id == id) return &item;
    }
    return nullptr;
}

std::string default_query_id(size_t index) {
    return "seq_" + std::to_string(index + 1);
}

// Fill one result slot. Never fails the batch.
static void process_query(const SequenceMatcher& matcher,
                          const BatchQuery& query,
                          const MatchConfig& config,
                          BatchItemResult& item) {
    item.metadata = query.metadata;
    item.sequence_length = static_cast<uint32_t>(trim_sequence(query.sequence).size());

    if (item.sequence_length == 0) {
        item.error = "Empty sequence";
        return;
    }

    std::string err;
    if (!matcher.match(query.sequence, config, item.matches, err)) {
        item.error = "Processing failed: " + err;
    }
}

bool run_batch(const SequenceMatcher& matcher,
               const std::vector<BatchQuery>& queries,
               const BatchConfig& config,
               BatchResult& result,
               const Logger& logger,
               std::string& error_msg) {
    result = BatchResult();
    if (!validate_match_config(config.match, error_msg)) {
        return false;
    }

    result.items.resize(queries.size());
    for (size_t i = 0; i < queries.size(); i++) {
        result.items[i].id = queries[i].id.empty() ? default_query_id(i) : queries[i].id;
    }

    int threads = config.threads > 0 ? config.threads : 1;
    logger.debug("Matching %zu queries (threads=%d)", queries.size(), threads);

    // Each task writes only its own slot; the index is read-only.
    tbb::task_arena arena(threads);
    arena.execute([&] {
        tbb::parallel_for(
            tbb::blocked_range<size_t>(0, queries.size()),
            [&](const tbb::blocked_range<size_t>& range) {
                for (size_t i = range.begin(); i < range.end(); i++) {
                    process_query(matcher, queries[i], config.match, result.items[i]);
                }
            });
    });

    BatchStats& st = result.stats;
    for (size_t i = 0; i < queries.size(); i++) {
        const BatchItemResult& item = result.items[i];
        st.total++;
        if (item.failed()) {
            st.errors++;
            logger.warn("Query %s: %s", item.id.c_str(), item.error.c_str());
        } else if (!item.matches.empty()) {
            st.successful++;
        }

        const auto& expected = queries[i].expected_species;
        if (expected && !expected->empty()) {
            st.with_expectation++;
            if (!item.matches.empty() && item.matches.front().species_id == *expected) {
                st.correct++;
            }
        }
    }

    st.failed = st.total - st.successful;

    logger.debug("Batch done: %zu successful, %zu failed (%zu errors), %zu total",
                 st.successful, st.failed, st.errors, st.total);
    return true;
}

} // namespace ednakmer
