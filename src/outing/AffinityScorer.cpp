#include "outing/AffinityScorer.hpp"

#include <algorithm>
#include <cmath>
#include <unordered_map>

#include "outing/Errors.hpp"

namespace outing {

static double clamp01(double x) {
    if (x < 0.0) return 0.0;
    if (x > 1.0) return 1.0;
    return x;
}

void validate_profile(const UserProfile& profile) {
    const std::string who = "profile '" + profile.user_id + "': ";

    for (const auto& [id, w] : profile.favorites) {
        if (!std::isfinite(w) || w <= 0.0) {
            throw InvalidProfile(who + "favorite weight for '" + id + "' must be finite and > 0");
        }
    }

    for (const auto& [id, h] : profile.history) {
        if (h.count < 0) {
            throw InvalidProfile(who + "history count for '" + id + "' must be >= 0");
        }
        if (!std::isfinite(h.days_since_last) || h.days_since_last < 0.0) {
            throw InvalidProfile(who + "history days_since_last for '" + id + "' must be finite and >= 0");
        }
    }
}

static double max_favorite_weight(const UserProfile& profile) {
    double m = 0.0;
    for (const auto& kv : profile.favorites) m = std::max(m, kv.second);
    return m;
}

static double recency_decay(double days, double half_life) {
    if (half_life <= 0.0) return days <= 0.0 ? 1.0 : 0.0;
    return std::pow(0.5, days / half_life);
}

using CatalogIndex = std::unordered_map<std::string, const Activity*>;

static CatalogIndex index_catalog(const std::vector<Activity>* catalog) {
    CatalogIndex out;
    if (!catalog) return out;
    out.reserve(catalog->size() * 2 + 8);
    for (const auto& a : *catalog) out.emplace(a.id, &a);
    return out;
}

static double history_signal(
    const UserProfile& profile,
    const Activity& activity,
    const CatalogIndex& by_id,
    const AffinityConfig& cfg
) {
    double signal = 0.0;
    for (const auto& [id, h] : profile.history) {
        if (h.count <= 0) continue;

        double relation = 0.0;
        if (id == activity.id) {
            relation = 1.0;
        } else if (!activity.category.empty()) {
            auto it = by_id.find(id);
            if (it != by_id.end() && it->second->category == activity.category) {
                relation = cfg.related_factor;
            }
        }
        if (relation <= 0.0) continue;

        signal += relation * static_cast<double>(h.count) * recency_decay(h.days_since_last, cfg.half_life_days);
    }
    return signal;
}

// Profile-wide facts shared by every activity scored against one profile.
struct ProfileSummary {
    bool has_favorites = false;
    bool has_history = false;
    double max_favorite = 0.0;
};

static ProfileSummary summarize(const UserProfile& profile) {
    ProfileSummary s;
    s.has_favorites = !profile.favorites.empty();
    s.has_history = std::any_of(profile.history.begin(), profile.history.end(),
                                [](const auto& kv) { return kv.second.count > 0; });
    s.max_favorite = max_favorite_weight(profile);
    return s;
}

// Profile already validated.
static AffinityBreakdown score_validated(
    const UserProfile& profile,
    const ProfileSummary& summary,
    const Activity& activity,
    const CatalogIndex& by_id,
    const AffinityConfig& cfg
) {
    AffinityBreakdown out;

    if (profile.exclusions.count(activity.id)) {
        out.excluded = true;
        out.total = 0.0;
        return out;
    }

    if (!summary.has_favorites && !summary.has_history) {
        out.cold_start = true;
        out.total = clamp01(cfg.cold_start_score);
        return out;
    }

    if (summary.has_favorites) {
        auto it = profile.favorites.find(activity.id);
        if (it != profile.favorites.end()) {
            out.is_favorite = true;
            out.favorite_component = clamp01(it->second / summary.max_favorite);
        }
    }

    if (summary.has_history) {
        out.history_signal = history_signal(profile, activity, by_id, cfg);
        const double denom = out.history_signal + std::max(cfg.history_saturation, 1e-12);
        out.history_component = clamp01(out.history_signal / denom);
    }

    if (summary.has_favorites && summary.has_history) {
        const double share = clamp01(cfg.favorites_share);
        out.total = share * out.favorite_component + (1.0 - share) * out.history_component;
    } else if (summary.has_favorites) {
        out.total = out.favorite_component;
    } else {
        out.total = out.history_component;
    }

    out.total = clamp01(out.total);
    return out;
}

AffinityBreakdown score_preference_detailed(
    const UserProfile& profile,
    const Activity& activity,
    const std::vector<Activity>* catalog,
    const AffinityConfig& cfg
) {
    validate_profile(profile);
    return score_validated(profile, summarize(profile), activity, index_catalog(catalog), cfg);
}

std::vector<AffinityBreakdown> score_preferences(
    const UserProfile& profile,
    const std::vector<Activity>& activities,
    const AffinityConfig& cfg
) {
    validate_profile(profile);

    const ProfileSummary summary = summarize(profile);
    const CatalogIndex by_id = index_catalog(&activities);

    std::vector<AffinityBreakdown> out;
    out.reserve(activities.size());
    for (const auto& a : activities) out.push_back(score_validated(profile, summary, a, by_id, cfg));
    return out;
}

double score_preference(
    const UserProfile& profile,
    const Activity& activity,
    const std::vector<Activity>* catalog,
    const AffinityConfig& cfg
) {
    return score_preference_detailed(profile, activity, catalog, cfg).total;
}

}  // namespace outing
