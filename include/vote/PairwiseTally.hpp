#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "vote/Ballot.hpp"

namespace vote {

struct PairwiseComparison {
    std::string candidate_a;
    std::string candidate_b;
    int votes_for_a = 0;
    int votes_for_b = 0;
    int tied = 0;
    int margin = 0;   // votes_for_a - votes_for_b

    std::optional<std::string> winner() const {
        if (votes_for_a > votes_for_b) return candidate_a;
        if (votes_for_b > votes_for_a) return candidate_b;
        return std::nullopt;
    }
};

// Table of head-to-head preference counts. prefer(a, b) is the number of
// ballots ranking a strictly above b; ballots tying a and b count for
// neither, so prefer(a, b) + prefer(b, a) + tied(a, b) == ballot_count().
class PairwiseTally {
public:
    PairwiseTally() = default;
    explicit PairwiseTally(std::vector<std::string> candidates);

    // Throws EmptyBallotSet, CandidateSetMismatch or InvalidBallot.
    static PairwiseTally from_ballots(const std::vector<Ballot>& ballots);

    // Ballot must be valid and over the same candidate set.
    void add_ballot(const Ballot& b);

    const std::vector<std::string>& candidates() const { return candidates_; }
    size_t size() const { return candidates_.size(); }
    int ballot_count() const { return ballot_count_; }

    std::optional<size_t> index_of(const std::string& id) const;

    int prefer(size_t a, size_t b) const { return counts_[a * candidates_.size() + b]; }
    int tied(size_t a, size_t b) const { return ballot_count_ - prefer(a, b) - prefer(b, a); }
    int margin(size_t a, size_t b) const { return prefer(a, b) - prefer(b, a); }
    bool beats(size_t a, size_t b) const { return prefer(a, b) > prefer(b, a); }

    // By id; throws std::out_of_range for unknown ids.
    int prefer(const std::string& a, const std::string& b) const;
    PairwiseComparison compare(const std::string& a, const std::string& b) const;

private:
    size_t require_index(const std::string& id) const;

    std::vector<std::string> candidates_;
    std::unordered_map<std::string, size_t> index_;
    std::vector<int> counts_;   // row-major size() x size()
    int ballot_count_ = 0;
};

}  // namespace vote
