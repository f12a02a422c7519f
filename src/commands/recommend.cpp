#include "commands/recommend.hpp"

#include "commands/Args.hpp"
#include "io/JsonIO.hpp"
#include "outing/Explain.hpp"
#include "outing/Models.hpp"
#include "outing/RecommendationArtifact.hpp"
#include "outing/Recommender.hpp"
#include "outing/Selector.hpp"

#include <filesystem>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>

namespace fs = std::filesystem;

// Either weight alone implies the other; both must then still sum to 1.
outing::RecommendWeights weights_from_args(int argc, char** argv) {
    outing::RecommendWeights w;
    const bool has_w = has_flag(argc, argv, "--weather_weight");
    const bool has_p = has_flag(argc, argv, "--preference_weight");

    if (has_w) w.weather = get_arg_double(argc, argv, "--weather_weight", w.weather);
    if (has_p) w.preference = get_arg_double(argc, argv, "--preference_weight", w.preference);

    if (has_w && !has_p) w.preference = 1.0 - w.weather;
    if (has_p && !has_w) w.weather = 1.0 - w.preference;
    return w;
}

outing::RecommendConfig recommend_config_from_args(int argc, char** argv) {
    outing::RecommendConfig cfg;
    cfg.weather.temp_margin_c = get_arg_double(argc, argv, "--temp_margin", cfg.weather.temp_margin_c);
    cfg.weather.air_quality_enabled = has_flag(argc, argv, "--air_quality");
    cfg.affinity.half_life_days = get_arg_double(argc, argv, "--half_life_days", cfg.affinity.half_life_days);
    return cfg;
}

int cmd_recommend(int argc, char** argv) {
    try {
        const fs::path catalog_path = get_arg(argc, argv, "--catalog", "data/catalog.json");
        const fs::path weather_path = get_arg(argc, argv, "--weather", "data/weather.json");
        const fs::path profile_path = get_arg(argc, argv, "--profile", "data/profile.json");
        const fs::path outdir = get_arg(argc, argv, "--outdir", "out");
        const bool explain = has_flag(argc, argv, "--explain");

        outing::SelectionConfig sel_cfg;
        sel_cfg.max_total = get_arg_int(argc, argv, "--top", sel_cfg.max_total);
        sel_cfg.max_per_category = get_arg_int(argc, argv, "--max_per_category", sel_cfg.max_per_category);

        const outing::RecommendWeights weights = weights_from_args(argc, argv);
        const outing::RecommendConfig cfg = recommend_config_from_args(argc, argv);

        const std::vector<outing::Activity> catalog = loadCatalog(catalog_path.string());
        const outing::WeatherObservation obs = loadObservation(weather_path.string());
        const outing::UserProfile profile = loadProfile(profile_path.string());

        const auto ranked = outing::recommend(obs, catalog, profile, weights, cfg);
        const outing::SelectionResult sel = outing::select_candidates(ranked, sel_cfg);

        outing::RecommendationArtifact artifact;
        artifact.user_id = profile.user_id;
        artifact.catalog_path = catalog_path.string();
        artifact.weather_path = weather_path.string();
        artifact.profile_path = profile_path.string();
        artifact.observation = obs;
        artifact.weights = weights;
        artifact.cfg = cfg;
        artifact.selection_cfg = sel_cfg;
        artifact.ranked = ranked;
        artifact.selected = sel.selected;
        artifact.decisions = sel.decisions;

        const fs::path out_path = outdir / "recommendations.json";
        artifact.write_to(out_path);

        std::cout << "USER: " << profile.user_id << "\n";
        std::cout << "LOCATION: " << obs.location << "\n";
        std::cout << "ACTIVITIES: " << catalog.size() << "\n";
        std::cout << "WEIGHTS: weather=" << weights.weather << " preference=" << weights.preference << "\n";
        std::cout << "OUT_RECOMMENDATIONS: " << out_path.string() << "\n";
        std::cout << "SELECTED: " << sel.selected.size() << "\n";

        std::cout << std::fixed << std::setprecision(3);
        int rank = 0;
        for (const auto& c : sel.selected) {
            std::cout << "  " << ++rank << ". " << c.id() << "  " << c.composite_score
                      << "  (weather " << c.weather_score << ", preference " << c.preference_score << ")\n";
        }

        if (explain) {
            std::cout << "\n";
            for (const auto& c : sel.selected) std::cout << outing::explain_candidate(c) << "\n";
        }

        return 0;
    } catch (const std::exception& e) {
        std::cerr << "recommend failed: " << e.what() << "\n";
        return 1;
    }
}
