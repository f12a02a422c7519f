#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"
#include "outing/Models.hpp"
#include "outing/Recommender.hpp"
#include "outing/Selector.hpp"

namespace outing {

nlohmann::json scored_candidate_to_json(const ScoredCandidate& c);

struct RecommendationArtifact {
    std::string user_id;
    std::string catalog_path;
    std::string weather_path;
    std::string profile_path;

    WeatherObservation observation;
    RecommendWeights weights;
    RecommendConfig cfg;
    SelectionConfig selection_cfg;

    std::vector<ScoredCandidate> ranked;         // full ranking
    std::vector<ScoredCandidate> selected;       // after caller-side selection
    std::vector<SelectionDecision> decisions;

    nlohmann::json to_json() const;
    void write_to(const std::filesystem::path& out_path) const;
};

}  // namespace outing
