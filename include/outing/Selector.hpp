#pragma once

#include <string>
#include <vector>

#include "outing/Models.hpp"

namespace outing {

struct SelectionConfig {
    int max_total = 10;
    int max_per_category = 3;   // <= 0 disables the category cap
    bool skip_excluded = true;  // drop candidates vetoed by the user
};

struct SelectionDecision {
    std::string activity_id;
    bool accepted = false;
    std::string reason;
};

struct SelectionResult {
    SelectionConfig cfg;
    std::vector<ScoredCandidate> selected;       // still in ranked order
    std::vector<SelectionDecision> decisions;    // one per candidate in ranked list order
};

// Caller-side truncation of a ranked list that spreads picks over categories.
SelectionResult select_candidates(const std::vector<ScoredCandidate>& ranked, const SelectionConfig& cfg);

}  // namespace outing
