#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>

#include "core/types.hpp"

namespace ednakmer {

inline constexpr const char* UNKNOWN_FIELD = "Unknown";

// Display and taxonomy metadata for one species.
struct SpeciesMetadata {
    SpeciesId species_id;
    std::string scientific_name;
    std::string common_name;
    std::string phylum;
    std::optional<std::string> kingdom;
    std::optional<std::string> class_name;
    std::optional<std::string> order;
    std::optional<std::string> family;
    std::optional<std::string> genus;

    // Copy of md with every empty display field set to "Unknown".
    static SpeciesMetadata with_defaults(SpeciesMetadata md);

    // Metadata for a species with no taxonomy record.
    static SpeciesMetadata unknown(const SpeciesId& species_id);

    // Optional ranks with "Unknown" for the missing ones.
    TaxonomyRanks ranks() const;
};

// Keyed species metadata lookup (species_id -> SpeciesMetadata).
class MetadataTable {
public:
    // Insert a record; display fields are default-filled.
    // Returns false (and keeps the existing record) if species_id is a duplicate.
    bool insert(SpeciesMetadata md);

    // nullptr if the species has no record.
    const SpeciesMetadata* find(const SpeciesId& species_id) const;

    // Record for species_id, or SpeciesMetadata::unknown() if absent.
    SpeciesMetadata lookup(const SpeciesId& species_id) const;

    size_t size() const { return records_.size(); }
    bool empty() const { return records_.empty(); }

private:
    std::unordered_map<SpeciesId, SpeciesMetadata> records_;
};

} // namespace ednakmer
