#include "core/confidence.hpp"
#include "core/config.hpp"

namespace ednakmer {

ConfidenceLevel classify_confidence(double score) {
    if (score >= HIGH_CONFIDENCE_SCORE) return ConfidenceLevel::kHigh;
    if (score >= MEDIUM_CONFIDENCE_SCORE) return ConfidenceLevel::kMedium;
    if (score >= LOW_CONFIDENCE_SCORE) return ConfidenceLevel::kLow;
    return ConfidenceLevel::kVeryLow;
}

const char* confidence_name(ConfidenceLevel level) {
    switch (level) {
        case ConfidenceLevel::kHigh:    return "high";
        case ConfidenceLevel::kMedium:  return "medium";
        case ConfidenceLevel::kLow:     return "low";
        case ConfidenceLevel::kVeryLow: return "very_low";
    }
    return "very_low";
}

bool parse_confidence(const std::string& str, ConfidenceLevel& out) {
    if (str == "high") {
        out = ConfidenceLevel::kHigh;
    } else if (str == "medium") {
        out = ConfidenceLevel::kMedium;
    } else if (str == "low") {
        out = ConfidenceLevel::kLow;
    } else if (str == "very_low") {
        out = ConfidenceLevel::kVeryLow;
    } else {
        return false;
    }
    return true;
}

} // namespace ednakmer
