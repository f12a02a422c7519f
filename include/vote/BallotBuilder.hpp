#pragma once

#include <set>
#include <string>
#include <vector>

#include "outing/Models.hpp"
#include "vote/Ballot.hpp"

namespace vote {

struct BallotConfig {
    // composite scores closer than this to the head of a tier join that tier;
    // must be finite and >= 0
    double tie_epsilon = 1e-9;
};

std::set<std::string> universe_of(const std::vector<outing::Activity>& activities);

// Restricts a voter's ranked list to the universe. Equal scores share a tier;
// universe members the voter never scored are tied last. Throws InvalidBallot
// on a negative or non-finite tie_epsilon.
Ballot build_ballot(
    const std::string& voter_id,
    const std::vector<outing::ScoredCandidate>& ranked,
    const std::set<std::string>& universe,
    const BallotConfig& cfg = {}
);

Ballot build_ballot(
    const std::string& voter_id,
    const std::vector<outing::ScoredCandidate>& ranked,
    const std::vector<outing::Activity>& universe,
    const BallotConfig& cfg = {}
);

// Strict ranking given as ids (best first). Unknown or repeated ids throw
// InvalidBallot; unranked universe members are tied last.
Ballot ballot_from_ranking(
    const std::string& voter_id,
    const std::vector<std::string>& ranking,
    const std::set<std::string>& universe
);

}  // namespace vote
