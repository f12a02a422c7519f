#include "vote/PairwiseTally.hpp"

#include <stdexcept>

#include "outing/Errors.hpp"

namespace vote {

PairwiseTally::PairwiseTally(std::vector<std::string> candidates)
    : candidates_(std::move(candidates)),
      counts_(candidates_.size() * candidates_.size(), 0) {
    index_.reserve(candidates_.size() * 2 + 8);
    for (size_t i = 0; i < candidates_.size(); ++i) index_.emplace(candidates_[i], i);
}

PairwiseTally PairwiseTally::from_ballots(const std::vector<Ballot>& ballots) {
    if (ballots.empty()) throw outing::EmptyBallotSet("no ballots to resolve");

    const std::vector<std::string>& universe = ballots.front().candidates;
    for (const auto& b : ballots) {
        validate_ballot(b);
        if (b.candidates != universe) {
            throw outing::CandidateSetMismatch("ballot of '" + b.voter_id + "' uses a different candidate set than '" +
                                               ballots.front().voter_id + "'");
        }
    }

    PairwiseTally t(universe);
    for (const auto& b : ballots) t.add_ballot(b);
    return t;
}

void PairwiseTally::add_ballot(const Ballot& b) {
    const size_t n = candidates_.size();

    // tier position per candidate index; lower is better
    std::vector<size_t> position(n, 0);
    for (size_t tier = 0; tier < b.tiers.size(); ++tier) {
        for (const auto& id : b.tiers[tier]) position[require_index(id)] = tier;
    }

    for (size_t a = 0; a < n; ++a) {
        for (size_t c = 0; c < n; ++c) {
            if (a != c && position[a] < position[c]) ++counts_[a * n + c];
        }
    }
    ++ballot_count_;
}

std::optional<size_t> PairwiseTally::index_of(const std::string& id) const {
    auto it = index_.find(id);
    if (it == index_.end()) return std::nullopt;
    return it->second;
}

size_t PairwiseTally::require_index(const std::string& id) const {
    auto it = index_.find(id);
    if (it == index_.end()) throw std::out_of_range("unknown candidate: " + id);
    return it->second;
}

int PairwiseTally::prefer(const std::string& a, const std::string& b) const {
    return prefer(require_index(a), require_index(b));
}

PairwiseComparison PairwiseTally::compare(const std::string& a, const std::string& b) const {
    const size_t ia = require_index(a);
    const size_t ib = require_index(b);

    PairwiseComparison pc;
    pc.candidate_a = a;
    pc.candidate_b = b;
    pc.votes_for_a = prefer(ia, ib);
    pc.votes_for_b = prefer(ib, ia);
    pc.tied = tied(ia, ib);
    pc.margin = pc.votes_for_a - pc.votes_for_b;
    return pc;
}

}  // namespace vote
