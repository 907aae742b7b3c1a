#pragma once

#include <ostream>
#include <string>
#include <vector>

#include "search/batch_runner.hpp"

namespace ednakmer {

enum class OutputFormat { kTab, kJson };

// Parse an output format string ("tab", "json").
// Returns true on success. On failure, out is unchanged and error_msg is set.
bool parse_output_format(const std::string& str, OutputFormat& out,
                         std::string& error_msg);

// Tab-delimited: one header line, one row per match.
// Failed queries are written as "# <query_id>: <error>" comment lines.
void write_results_tab(std::ostream& out, const BatchResult& result);

// JSON: {"results": [...], "summary": {...}}.
void write_results_json(std::ostream& out, const BatchResult& result);

void write_results(std::ostream& out, const BatchResult& result, OutputFormat fmt);

// Human-readable ranking for one query, as printed by interactive mode.
void write_match_report(std::ostream& out, const std::string& query_label,
                        size_t query_length,
                        const std::vector<ScoredMatch>& matches);

} // namespace ednakmer
