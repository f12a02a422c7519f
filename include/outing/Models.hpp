#pragma once

#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace outing {

struct ToleranceProfile {
    double temp_min = 10.0;              // comfortable range, degrees C
    double temp_max = 25.0;
    double max_wind_kmh = 30.0;          // score reaches 0 here
    double max_precip_probability = 0.5; // 0..1
};

struct Activity {
    std::string id;        // unique, stable
    std::string name;
    std::string category;  // hiking, culture, sport ...
    ToleranceProfile tolerance;
    bool indoor = false;
};

struct WeatherObservation {
    std::string location;
    std::string timestamp;               // ISO-8601, not interpreted
    double temperature_c = 0.0;
    double wind_kmh = 0.0;
    double precip_probability = 0.0;     // 0..1
    std::optional<double> air_quality_index;
};

struct HistoryEntry {
    int count = 0;
    double days_since_last = 0.0;
};

struct UserProfile {
    std::string user_id;
    std::map<std::string, double> favorites;     // activity id -> weight (> 0)
    std::map<std::string, HistoryEntry> history; // activity id -> usage
    std::set<std::string> exclusions;
};

struct ScoredCandidate {
    const Activity* activity = nullptr;  // points into the caller's catalog

    double weather_score = 0.0;
    double preference_score = 0.0;
    double composite_score = 0.0;
    bool excluded = false;               // vetoed by the user profile

    std::vector<std::string> reasons;

    const std::string& id() const { return activity->id; }
};

}  // namespace outing
