#include "outing/Recommender.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <unordered_set>

#include "outing/Errors.hpp"

namespace outing {

static constexpr double kWeightSumTolerance = 1e-9;

void validate_weights(const RecommendWeights& w) {
    if (!std::isfinite(w.weather) || !std::isfinite(w.preference) || w.weather < 0.0 || w.preference < 0.0) {
        throw InvalidWeights("weights must be finite and >= 0");
    }
    const double sum = w.weather + w.preference;
    if (std::fabs(sum - 1.0) > kWeightSumTolerance) {
        std::ostringstream oss;
        oss << "weights must sum to 1 (weather=" << w.weather << ", preference=" << w.preference << ")";
        throw InvalidWeights(oss.str());
    }
}

bool ranks_before(const ScoredCandidate& a, const ScoredCandidate& b) {
    if (a.composite_score != b.composite_score) return a.composite_score > b.composite_score;
    return a.id() < b.id();
}

static void add_weather_reasons(std::vector<std::string>& reasons, const WeatherScoreBreakdown& w) {
    if (w.temperature_fit >= 1.0) reasons.push_back("temperature within comfort range");
    else if (w.temperature_fit <= 0.0) reasons.push_back("temperature far outside comfort range");
    else reasons.push_back("temperature slightly outside comfort range");

    if (w.indoor) {
        reasons.push_back("indoor: only travel temperature counts");
        return;
    }

    if (w.wind_fit <= 0.0) reasons.push_back("too windy");
    else if (w.wind_fit < 1.0) reasons.push_back("windy");

    if (w.precip_fit <= 0.0) reasons.push_back("rain likely");
    else if (w.precip_fit < 1.0) reasons.push_back("some chance of rain");

    if (w.air_quality_factor < 1.0) reasons.push_back("poor air quality");
}

static void add_preference_reasons(std::vector<std::string>& reasons, const AffinityBreakdown& p) {
    if (p.excluded) {
        reasons.push_back("excluded by user");
        return;
    }
    if (p.cold_start) {
        reasons.push_back("new user: neutral preference");
        return;
    }
    if (p.is_favorite) reasons.push_back("favorite");
    if (p.history_component >= 0.5) reasons.push_back("done often or recently");
    else if (p.history_component > 0.0) reasons.push_back("done before");
}

std::vector<ScoredCandidate> recommend(
    const WeatherObservation& obs,
    const std::vector<Activity>& activities,
    const UserProfile& profile,
    const RecommendWeights& weights,
    const RecommendConfig& cfg
) {
    if (activities.empty()) throw EmptyCandidateSet("recommend called with no activities");

    validate_weights(weights);
    validate_observation(obs);

    std::unordered_set<std::string> seen;
    seen.reserve(activities.size() * 2 + 8);
    for (const auto& a : activities) {
        if (!seen.insert(a.id).second) throw InvalidActivity("duplicate activity id: " + a.id);
    }

    const std::vector<AffinityBreakdown> prefs = score_preferences(profile, activities, cfg.affinity);

    std::vector<ScoredCandidate> out;
    out.reserve(activities.size());

    for (size_t i = 0; i < activities.size(); ++i) {
        const Activity& a = activities[i];
        const WeatherScoreBreakdown w = score_weather_detailed(obs, a, cfg.weather);
        const AffinityBreakdown& p = prefs[i];

        ScoredCandidate sc;
        sc.activity = &a;
        sc.weather_score = w.total;
        sc.preference_score = p.total;
        // weights may sum to 1 + kWeightSumTolerance
        sc.composite_score = std::min(1.0, weights.weather * w.total + weights.preference * p.total);
        sc.excluded = p.excluded;

        add_weather_reasons(sc.reasons, w);
        add_preference_reasons(sc.reasons, p);

        out.push_back(std::move(sc));
    }

    std::sort(out.begin(), out.end(), ranks_before);
    return out;
}

}  // namespace outing
