#include "index/reference_index.hpp"

namespace ednakmer {

const IndexedSpecies* ReferenceIndex::find(const SpeciesId& species_id) const {
    auto it = positions_.find(species_id);
    if (it == positions_.end()) return nullptr;
    return &species_[it->second];
}

SpeciesMetadata ReferenceIndex::metadata(const SpeciesId& species_id) const {
    const IndexedSpecies* sp = find(species_id);
    if (sp) return sp->metadata;
    return SpeciesMetadata::unknown(species_id);
}

} // namespace ednakmer
