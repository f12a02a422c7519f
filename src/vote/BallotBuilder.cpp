#include "vote/BallotBuilder.hpp"

#include <algorithm>
#include <cmath>
#include <unordered_set>

#include "outing/Errors.hpp"

namespace vote {

std::set<std::string> universe_of(const std::vector<outing::Activity>& activities) {
    std::set<std::string> out;
    for (const auto& a : activities) out.insert(a.id);
    return out;
}

static void append_unranked_tier(Ballot& b, const std::set<std::string>& universe,
                                 const std::unordered_set<std::string>& ranked) {
    std::vector<std::string> rest;
    for (const auto& id : universe) {
        if (ranked.find(id) == ranked.end()) rest.push_back(id);
    }
    if (!rest.empty()) b.tiers.push_back(std::move(rest));
}

Ballot build_ballot(
    const std::string& voter_id,
    const std::vector<outing::ScoredCandidate>& ranked,
    const std::set<std::string>& universe,
    const BallotConfig& cfg
) {
    if (universe.empty()) throw outing::EmptyCandidateSet("ballot for '" + voter_id + "' has no candidates");
    if (!std::isfinite(cfg.tie_epsilon) || cfg.tie_epsilon < 0.0) {
        throw outing::InvalidBallot("ballot for '" + voter_id + "': tie_epsilon must be finite and >= 0");
    }

    std::vector<const outing::ScoredCandidate*> kept;
    kept.reserve(ranked.size());

    std::unordered_set<std::string> seen;
    seen.reserve(ranked.size() * 2 + 8);

    for (const auto& c : ranked) {
        if (universe.find(c.id()) == universe.end()) continue;
        if (!seen.insert(c.id()).second) {
            throw outing::InvalidBallot("ballot of '" + voter_id + "': candidate " + c.id() + " scored twice");
        }
        kept.push_back(&c);
    }

    // Input is normally already ranked; sorting again keeps tiers contiguous if it is not.
    std::stable_sort(kept.begin(), kept.end(),
                     [](const outing::ScoredCandidate* a, const outing::ScoredCandidate* b) {
                         return a->composite_score > b->composite_score;
                     });

    Ballot b;
    b.voter_id = voter_id;
    b.candidates.assign(universe.begin(), universe.end());

    double tier_head = 0.0;
    for (const auto* c : kept) {
        if (b.tiers.empty() || std::fabs(tier_head - c->composite_score) > cfg.tie_epsilon) {
            b.tiers.emplace_back();
            tier_head = c->composite_score;
        }
        b.tiers.back().push_back(c->id());
    }
    for (auto& tier : b.tiers) std::sort(tier.begin(), tier.end());

    append_unranked_tier(b, universe, seen);
    return b;
}

Ballot build_ballot(
    const std::string& voter_id,
    const std::vector<outing::ScoredCandidate>& ranked,
    const std::vector<outing::Activity>& universe,
    const BallotConfig& cfg
) {
    return build_ballot(voter_id, ranked, universe_of(universe), cfg);
}

Ballot ballot_from_ranking(
    const std::string& voter_id,
    const std::vector<std::string>& ranking,
    const std::set<std::string>& universe
) {
    if (universe.empty()) throw outing::EmptyCandidateSet("ballot for '" + voter_id + "' has no candidates");

    Ballot b;
    b.voter_id = voter_id;
    b.candidates.assign(universe.begin(), universe.end());

    std::unordered_set<std::string> seen;
    seen.reserve(ranking.size() * 2 + 8);

    for (const auto& id : ranking) {
        if (universe.find(id) == universe.end()) {
            throw outing::InvalidBallot("ballot of '" + voter_id + "': candidate " + id + " not in candidate set");
        }
        if (!seen.insert(id).second) {
            throw outing::InvalidBallot("ballot of '" + voter_id + "': duplicate candidate " + id);
        }
        b.tiers.push_back({id});
    }

    append_unranked_tier(b, universe, seen);
    return b;
}

}  // namespace vote
