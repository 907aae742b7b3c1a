#pragma once

#include <string>

#include "core/types.hpp"

namespace ednakmer {

// Map a matching score (0-100) to its confidence band.
//   >= 85 high, >= 70 medium, >= 50 low, otherwise very_low.
ConfidenceLevel classify_confidence(double score);

// "high", "medium", "low", "very_low"
const char* confidence_name(ConfidenceLevel level);

// Parse a confidence name. Returns true on success; out is unchanged otherwise.
bool parse_confidence(const std::string& str, ConfidenceLevel& out);

} // namespace ednakmer
