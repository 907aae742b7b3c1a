#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "core/config.hpp"
#include "core/kmer_encoding.hpp"
#include "core/types.hpp"
#include "index/reference_index.hpp"

namespace ednakmer {

class Logger;
class MetadataTable;

// Configuration for index building.
struct IndexBuilderConfig {
    int k = DEFAULT_K;     // k-mer length
    bool verbose = false;  // progress display
};

// Incremental ReferenceIndex construction.
//
//   ReferenceIndexBuilder builder(metadata);
//   if (!builder.start(k, error_msg)) ...
//   for (const auto& rec : corpus) builder.add(rec);
//   ReferenceIndexPtr index = builder.finish();
//
// Metadata is looked up once per species, on first encounter; species
// without a metadata record get "Unknown" display fields.
class ReferenceIndexBuilder {
public:
    explicit ReferenceIndexBuilder(const MetadataTable& metadata);

    // Begin a new index. Returns false if k < MIN_K.
    bool start(int k, std::string& error_msg);

    // Accumulate the valid k-mers of one reference sequence into its species.
    // Sequences without any valid k-mer still register the species.
    void add(const ReferenceRecord& record);

    // Species registered so far.
    size_t num_species() const;

    // Hand over the finished index. The builder must be start()ed again
    // before further use.
    ReferenceIndexPtr finish();

private:
    const MetadataTable& metadata_;
    std::unique_ptr<ReferenceIndex> index_;
    std::unique_ptr<KmerScanner> scanner_;
};

// Build a ReferenceIndex from a whole corpus.
// Returns nullptr and sets error_msg if config.k is invalid.
ReferenceIndexPtr build_reference_index(const std::vector<ReferenceRecord>& corpus,
                                        const MetadataTable& metadata,
                                        const IndexBuilderConfig& config,
                                        const Logger& logger,
                                        std::string& error_msg);

} // namespace ednakmer
