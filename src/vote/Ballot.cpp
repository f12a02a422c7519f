#include "vote/Ballot.hpp"

#include <algorithm>
#include <unordered_set>

#include "outing/Errors.hpp"

namespace vote {

void validate_ballot(const Ballot& b) {
    const std::string who = "ballot of '" + b.voter_id + "': ";

    if (b.candidates.empty()) throw outing::InvalidBallot(who + "empty candidate set");
    if (!std::is_sorted(b.candidates.begin(), b.candidates.end()) ||
        std::adjacent_find(b.candidates.begin(), b.candidates.end()) != b.candidates.end()) {
        throw outing::InvalidBallot(who + "candidate set must be sorted and unique");
    }

    std::unordered_set<std::string> seen;
    seen.reserve(b.candidates.size() * 2 + 8);

    for (const auto& tier : b.tiers) {
        if (tier.empty()) throw outing::InvalidBallot(who + "empty tier");
        for (const auto& id : tier) {
            if (!std::binary_search(b.candidates.begin(), b.candidates.end(), id)) {
                throw outing::InvalidBallot(who + "candidate " + id + " not in candidate set");
            }
            if (!seen.insert(id).second) {
                throw outing::InvalidBallot(who + "candidate " + id + " ranked twice");
            }
        }
    }

    if (seen.size() != b.candidates.size()) {
        throw outing::InvalidBallot(who + "tiers do not cover every candidate");
    }
}

}  // namespace vote
