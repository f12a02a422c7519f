#include "outing/Explain.hpp"

#include <iomanip>
#include <sstream>
#include <vector>

namespace outing {

bool is_negative_reason(const std::string& reason) {
    static const std::vector<std::string> markers = {
        "outside", "windy", "rain", "poor", "excluded"
    };
    for (const auto& m : markers) {
        if (reason.find(m) != std::string::npos) return true;
    }
    return false;
}

std::string explain_candidate(const ScoredCandidate& c) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);

    oss << c.activity->name << " [" << c.activity->id << "]\n";
    oss << "  score: " << c.composite_score
        << " (weather " << c.weather_score << ", preference " << c.preference_score << ")\n";

    std::vector<std::string> good;
    std::vector<std::string> bad;
    for (const auto& r : c.reasons) {
        if (is_negative_reason(r)) bad.push_back(r);
        else good.push_back(r);
    }

    if (!good.empty()) {
        oss << "  for:\n";
        for (const auto& r : good) oss << "    + " << r << "\n";
    }
    if (!bad.empty()) {
        oss << "  against:\n";
        for (const auto& r : bad) oss << "    - " << r << "\n";
    }

    return oss.str();
}

}  // namespace outing
