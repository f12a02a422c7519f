#pragma once

#include <string>
#include <vector>

namespace vote {

// Ordinal ballot over a fixed candidate universe. Tiers are ordered best
// first; ids inside one tier are tied. Tiers partition `candidates`.
struct Ballot {
    std::string voter_id;
    std::vector<std::string> candidates;           // sorted, unique
    std::vector<std::vector<std::string>> tiers;   // each tier sorted
};

// Throws outing::InvalidBallot when tiers do not partition candidates.
void validate_ballot(const Ballot& b);

}  // namespace vote
