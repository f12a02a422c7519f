#include "outing/RecommendationArtifact.hpp"

#include <fstream>
#include <stdexcept>

namespace outing {

nlohmann::json scored_candidate_to_json(const ScoredCandidate& c) {
    nlohmann::json j;

    j["activity_id"] = c.activity->id;
    j["name"] = c.activity->name;
    j["category"] = c.activity->category;
    j["indoor"] = c.activity->indoor;

    j["score"] = {
        {"weather", c.weather_score},
        {"preference", c.preference_score},
        {"composite", c.composite_score},
    };
    j["excluded"] = c.excluded;
    j["reasons"] = c.reasons;

    return j;
}

nlohmann::json RecommendationArtifact::to_json() const {
    nlohmann::json j;

    j["user_id"] = user_id;
    j["catalog_path"] = catalog_path;
    j["weather_path"] = weather_path;
    j["profile_path"] = profile_path;

    nlohmann::json obs = {
        {"location", observation.location},
        {"timestamp", observation.timestamp},
        {"temperature_c", observation.temperature_c},
        {"wind_kmh", observation.wind_kmh},
        {"precip_probability", observation.precip_probability},
    };
    if (observation.air_quality_index) obs["air_quality_index"] = *observation.air_quality_index;
    j["observation"] = obs;

    j["weights"] = {
        {"weather", weights.weather},
        {"preference", weights.preference}
    };

    j["weather_config"] = {
        {"temp_margin_c", cfg.weather.temp_margin_c},
        {"wind_comfort_fraction", cfg.weather.wind_comfort_fraction},
        {"precip_comfort_fraction", cfg.weather.precip_comfort_fraction},
        {"air_quality_enabled", cfg.weather.air_quality_enabled}
    };

    j["affinity_config"] = {
        {"cold_start_score", cfg.affinity.cold_start_score},
        {"favorites_share", cfg.affinity.favorites_share},
        {"half_life_days", cfg.affinity.half_life_days},
        {"related_factor", cfg.affinity.related_factor},
        {"history_saturation", cfg.affinity.history_saturation}
    };

    j["selection_config"] = {
        {"max_total", selection_cfg.max_total},
        {"max_per_category", selection_cfg.max_per_category},
        {"skip_excluded", selection_cfg.skip_excluded}
    };

    nlohmann::json arr = nlohmann::json::array();
    for (const auto& c : ranked) arr.push_back(scored_candidate_to_json(c));
    j["ranked"] = arr;

    nlohmann::json sel = nlohmann::json::array();
    for (const auto& c : selected) sel.push_back(c.activity->id);
    j["selected"] = sel;

    nlohmann::json dec = nlohmann::json::array();
    for (const auto& d : decisions) {
        dec.push_back({
            {"activity_id", d.activity_id},
            {"accepted", d.accepted},
            {"reason", d.reason}
        });
    }
    j["selection_decisions"] = dec;

    return j;
}

void RecommendationArtifact::write_to(const std::filesystem::path& out_path) const {
    if (out_path.has_parent_path()) std::filesystem::create_directories(out_path.parent_path());

    std::ofstream out(out_path);
    if (!out) throw std::runtime_error("Failed to open output file: " + out_path.string());

    out << to_json().dump(2) << "\n";
}

}  // namespace outing
