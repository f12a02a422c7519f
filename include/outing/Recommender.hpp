#pragma once

#include <vector>

#include "outing/AffinityScorer.hpp"
#include "outing/Models.hpp"
#include "outing/WeatherScorer.hpp"

namespace outing {

// 40% weather / 60% preference is the contract; callers may override but the
// two weights must stay non-negative and sum to 1 within 1e-9. The composite
// is capped at 1 so that slack never pushes a score above 1.
struct RecommendWeights {
    double weather = 0.4;
    double preference = 0.6;
};

struct RecommendConfig {
    WeatherScoreConfig weather;
    AffinityConfig affinity;
};

// Throws InvalidWeights.
void validate_weights(const RecommendWeights& w);

// Full ranking, composite desc then activity id asc. Never truncates.
// The returned candidates point into `activities`, which must outlive them.
std::vector<ScoredCandidate> recommend(
    const WeatherObservation& obs,
    const std::vector<Activity>& activities,
    const UserProfile& profile,
    const RecommendWeights& weights = {},
    const RecommendConfig& cfg = {}
);

// Ordering used by recommend(); exposed for callers that merge or re-sort lists.
bool ranks_before(const ScoredCandidate& a, const ScoredCandidate& b);

}  // namespace outing
