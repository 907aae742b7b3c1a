#include "index/species_metadata.hpp"

#include <utility>

namespace ednakmer {

static void fill_unknown(std::string& field) {
    if (field.empty()) field = UNKNOWN_FIELD;
}

SpeciesMetadata SpeciesMetadata::with_defaults(SpeciesMetadata md) {
    fill_unknown(md.scientific_name);
    fill_unknown(md.common_name);
    fill_unknown(md.phylum);
    return md;
}

SpeciesMetadata SpeciesMetadata::unknown(const SpeciesId& species_id) {
    SpeciesMetadata md;
    md.species_id = species_id;
    return with_defaults(std::move(md));
}

TaxonomyRanks SpeciesMetadata::ranks() const {
    TaxonomyRanks r;
    r.kingdom = kingdom.value_or(UNKNOWN_FIELD);
    r.class_name = class_name.value_or(UNKNOWN_FIELD);
    r.order = order.value_or(UNKNOWN_FIELD);
    r.family = family.value_or(UNKNOWN_FIELD);
    r.genus = genus.value_or(UNKNOWN_FIELD);
    return r;
}

bool MetadataTable::insert(SpeciesMetadata md) {
    SpeciesId id = md.species_id;
    return records_.emplace(std::move(id),
                            SpeciesMetadata::with_defaults(std::move(md))).second;
}

const SpeciesMetadata* MetadataTable::find(const SpeciesId& species_id) const {
    auto it = records_.find(species_id);
    return it == records_.end() ? nullptr : &it->second;
}

SpeciesMetadata MetadataTable::lookup(const SpeciesId& species_id) const {
    const SpeciesMetadata* md = find(species_id);
    if (md) return *md;
    return SpeciesMetadata::unknown(species_id);
}

} // namespace ednakmer
