#pragma once

#include <istream>
#include <string>
#include <vector>

#include "core/types.hpp"

namespace ednakmer {

struct FastaRecord {
    std::string id;          // first word after '>'
    std::string description; // rest of the header line, trimmed
    std::string sequence;    // concatenated sequence lines, as written
};

// Read all records from an input stream.
std::vector<FastaRecord> read_fasta_stream(std::istream& in);

// Read all records from a FASTA file. path can be "-" for stdin.
// Returns false and sets error_msg if the file cannot be opened.
bool read_fasta(const std::string& path, std::vector<FastaRecord>& records,
                std::string& error_msg);

// Read a reference corpus: one ReferenceRecord per FASTA record, with the
// header's first word as species_id. A species may appear several times.
bool read_reference_fasta(const std::string& path,
                          std::vector<ReferenceRecord>& corpus,
                          std::string& error_msg);

} // namespace ednakmer
