#pragma once

#include <vector>

#include "outing/Models.hpp"

namespace outing {

struct AffinityConfig {
    double cold_start_score = 0.5;

    // share of the favorites component when a profile has both signals
    double favorites_share = 0.6;

    // history: relation * count * 0.5^(days / half_life), squashed by s / (s + saturation)
    double half_life_days = 30.0;
    double related_factor = 0.5;     // same category, different activity
    double history_saturation = 1.0;
};

struct AffinityBreakdown {
    bool excluded = false;
    bool cold_start = false;
    bool is_favorite = false;

    double favorite_component = 0.0;
    double history_signal = 0.0;     // raw decayed sum before squashing
    double history_component = 0.0;
    double total = 0.0;
};

// Throws InvalidProfile on non-finite / non-positive favorite weights or bad history.
void validate_profile(const UserProfile& profile);

// catalog is optional and only used to find activities related by category.
AffinityBreakdown score_preference_detailed(
    const UserProfile& profile,
    const Activity& activity,
    const std::vector<Activity>* catalog = nullptr,
    const AffinityConfig& cfg = {}
);

// One breakdown per activity, in input order, with `activities` doubling as the
// catalog. Validates the profile and indexes the catalog once.
std::vector<AffinityBreakdown> score_preferences(
    const UserProfile& profile,
    const std::vector<Activity>& activities,
    const AffinityConfig& cfg = {}
);

double score_preference(
    const UserProfile& profile,
    const Activity& activity,
    const std::vector<Activity>* catalog = nullptr,
    const AffinityConfig& cfg = {}
);

}  // namespace outing
