#pragma once

#include <string>

#include "outing/Models.hpp"

namespace outing {

// Multi-line, human-readable summary of one candidate: scores, then the
// favourable reasons, then the ones that count against it.
std::string explain_candidate(const ScoredCandidate& c);

// true for reasons that lower a score (rain, wind, exclusion ...)
bool is_negative_reason(const std::string& reason);

}  // namespace outing
