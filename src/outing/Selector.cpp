#include "outing/Selector.hpp"

#include <algorithm>
#include <unordered_map>

#include "outing/Recommender.hpp"

namespace outing {

static std::string category_key(const ScoredCandidate& c) {
    return c.activity->category.empty() ? c.activity->id : c.activity->category;
}

SelectionResult select_candidates(const std::vector<ScoredCandidate>& ranked, const SelectionConfig& cfg) {
    SelectionResult res;
    res.cfg = cfg;
    res.decisions.reserve(ranked.size());

    std::vector<ScoredCandidate> selected;
    selected.reserve(std::min(static_cast<int>(ranked.size()), std::max(cfg.max_total, 0)));

    std::unordered_map<std::string, int> category_counts;
    category_counts.reserve(64);

    // indices into ranked / decisions rejected only because of the category cap
    std::vector<size_t> capped;

    auto can_take = [&](const ScoredCandidate& c) -> std::pair<bool, std::string> {
        if (cfg.skip_excluded && c.excluded) return {false, "excluded"};
        if (static_cast<int>(selected.size()) >= cfg.max_total) return {false, "total_cap"};

        if (cfg.max_per_category > 0) {
            auto it = category_counts.find(category_key(c));
            const int cc = (it == category_counts.end()) ? 0 : it->second;
            if (cc >= cfg.max_per_category) return {false, "category_cap"};
        }
        return {true, ""};
    };

    // Greedy pass in ranked order
    for (size_t i = 0; i < ranked.size(); ++i) {
        const auto& c = ranked[i];
        auto ok = can_take(c);
        if (!ok.first) {
            if (ok.second == "category_cap") capped.push_back(i);
            res.decisions.push_back(SelectionDecision{c.id(), false, ok.second});
            continue;
        }

        selected.push_back(c);
        category_counts[category_key(c)]++;
        res.decisions.push_back(SelectionDecision{c.id(), true, "selected"});
    }

    // Backfill: if the category cap left room, take the best capped candidates.
    for (size_t i : capped) {
        if (static_cast<int>(selected.size()) >= cfg.max_total) break;
        selected.push_back(ranked[i]);
        res.decisions[i].accepted = true;
        res.decisions[i].reason = "backfill";
    }

    std::sort(selected.begin(), selected.end(), ranks_before);

    res.selected = std::move(selected);
    return res;
}

}  // namespace outing
