#include "index/index_builder.hpp"
#include "index/species_metadata.hpp"
#include "util/logger.hpp"
#include "util/progress.hpp"

#include <memory>
#include <utility>

namespace ednakmer {

ReferenceIndexBuilder::ReferenceIndexBuilder(const MetadataTable& metadata)
    : metadata_(metadata) {}

bool ReferenceIndexBuilder::start(int k, std::string& error_msg) {
    if (!valid_k(k)) {
        error_msg = "k must be at least " + std::to_string(MIN_K) +
                    " (got " + std::to_string(k) + ")";
        return false;
    }
    index_ = std::make_unique<ReferenceIndex>(ReferenceIndex::BuildKey(), k);
    scanner_ = std::make_unique<KmerScanner>(k);
    return true;
}

void ReferenceIndexBuilder::add(const ReferenceRecord& record) {
    if (!index_) return;

    auto it = index_->positions_.find(record.species_id);
    size_t pos;
    if (it == index_->positions_.end()) {
        pos = index_->species_.size();
        IndexedSpecies sp;
        sp.metadata = metadata_.lookup(record.species_id);
        index_->species_.push_back(std::move(sp));
        index_->positions_.emplace(record.species_id, pos);
    } else {
        pos = it->second;
    }

    IndexedSpecies& sp = index_->species_[pos];
    index_->total_kmers_ += sp.profile.add_sequence(record.sequence, *scanner_);
    sp.num_sequences++;
    index_->num_sequences_++;
}

size_t ReferenceIndexBuilder::num_species() const {
    return index_ ? index_->species_.size() : 0;
}

ReferenceIndexPtr ReferenceIndexBuilder::finish() {
    if (!index_) return nullptr;

    uint64_t distinct = 0;
    for (const auto& sp : index_->species_) {
        distinct += sp.profile.distinct();
    }
    index_->total_distinct_ = distinct;

    scanner_.reset();
    return ReferenceIndexPtr(std::move(index_));
}

ReferenceIndexPtr build_reference_index(const std::vector<ReferenceRecord>& corpus,
                                        const MetadataTable& metadata,
                                        const IndexBuilderConfig& config,
                                        const Logger& logger,
                                        std::string& error_msg) {
    ReferenceIndexBuilder builder(metadata);
    if (!builder.start(config.k, error_msg)) {
        return nullptr;
    }

    logger.info("Building k-mer reference index: k=%d, sequences=%zu",
                config.k, corpus.size());

    Progress prog("Indexing", corpus.size(), config.verbose);
    uint64_t done = 0;
    for (const auto& rec : corpus) {
        builder.add(rec);
        done++;
        if (config.verbose) {
            prog.update(done, std::to_string(builder.num_species()) + " species");
        }
    }
    prog.finish();

    ReferenceIndexPtr index = builder.finish();

    size_t no_metadata = 0;
    size_t empty_profiles = 0;
    for (const auto& sp : index->species()) {
        if (!metadata.find(sp.metadata.species_id)) no_metadata++;
        if (sp.profile.empty()) empty_profiles++;
    }

    logger.info("Reference index built with %zu species", index->num_species());
    logger.info("Total k-mer profiles: %lu distinct, %lu occurrences",
                static_cast<unsigned long>(index->total_distinct_kmers()),
                static_cast<unsigned long>(index->total_kmers()));
    if (no_metadata > 0) {
        logger.warn("%zu species have no taxonomy record (shown as Unknown)",
                    no_metadata);
    }
    if (empty_profiles > 0) {
        logger.warn("%zu species have no valid %d-mer and will never match",
                    empty_profiles, config.k);
    }
    return index;
}

} // namespace ednakmer
