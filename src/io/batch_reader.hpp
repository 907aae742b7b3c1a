#pragma once

#include <istream>
#include <string>
#include <vector>

#include "search/batch_runner.hpp"

namespace ednakmer {

// Read batch queries from JSON.
//
// Accepted layouts:
//   {"test_sequences": [ {...}, ... ]}
//   {"sequences": [ {...}, ... ]}
//   [ {...}, ... ]
// Each item is either a bare sequence string or an object with
//   "sequence" (required), "test_id" or "id", "expected_match", "description",
//   "metadata" (any JSON value, passed through to the result).
// Items without an id are named seq_<n> (1-based position).
// Object items lacking "sequence" become queries with an empty sequence so the
// batch reports them instead of silently dropping them.
//
// Returns false and sets error_msg on malformed JSON or an unexpected layout.
bool read_batch_json_stream(std::istream& in, std::vector<BatchQuery>& queries,
                            std::string& error_msg);

bool read_batch_json(const std::string& path, std::vector<BatchQuery>& queries,
                     std::string& error_msg);

// Convert FASTA query records into batch queries (id = first header word,
// description = rest of the header).
bool read_batch_fasta(const std::string& path, std::vector<BatchQuery>& queries,
                      std::string& error_msg);

} // namespace ednakmer
