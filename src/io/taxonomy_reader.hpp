#pragma once

#include <istream>
#include <string>

#include "index/species_metadata.hpp"

namespace ednakmer {

// Read a tab-separated taxonomy table into table.
//
// The first non-comment line is a header naming the columns. Recognized
// columns: species_id (required), scientific_name (or species),
// common_name, phylum, kingdom, class, order, family, genus. Unknown columns
// are ignored, empty cells count as missing, '#' lines are comments.
// Rows without a species_id are skipped; duplicate species keep the first row.
//
// Returns false and sets error_msg if the header lacks species_id.
bool read_taxonomy_stream(std::istream& in, MetadataTable& table,
                          std::string& error_msg);

// As above, from a file. Returns false if the file cannot be opened.
bool read_taxonomy(const std::string& path, MetadataTable& table,
                   std::string& error_msg);

} // namespace ednakmer
