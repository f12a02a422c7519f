#pragma once

#include <optional>
#include <string>
#include <vector>

#include "vote/Ballot.hpp"
#include "vote/PairwiseTally.hpp"

namespace vote {

enum class RankingCriterion {
    Wins,       // a Condorcet winner exists
    Copeland    // no Condorcet winner: wins - losses
};

struct CandidateStanding {
    std::string id;
    int wins = 0;
    int losses = 0;
    int ties = 0;
    int copeland = 0;      // wins - losses
    int margin_lost = 0;   // sum of losing margins over all pairwise defeats
};

struct VotingResult {
    std::optional<std::string> winner;
    bool condorcet_winner = false;   // winner beats every other candidate head-to-head
    bool cycle_broken = false;       // winner came from the Copeland fallback
    RankingCriterion criterion = RankingCriterion::Wins;

    std::vector<CandidateStanding> ranking;   // best first
    std::vector<std::string> smith_set;       // sorted ids

    int ballot_count = 0;
    PairwiseTally tally;
};

// Wins, losses, ties and margins per candidate, in tally candidate order.
std::vector<CandidateStanding> compute_standings(const PairwiseTally& tally);

// Smallest non-empty set whose members each beat every candidate outside it.
std::vector<std::string> compute_smith_set(const PairwiseTally& tally);

// Throws EmptyBallotSet, CandidateSetMismatch, InvalidBallot.
VotingResult resolve_vote(const std::vector<Ballot>& ballots);

// Same resolution over an already built tally.
VotingResult resolve_tally(const PairwiseTally& tally);

const char* criterion_str(RankingCriterion c);

}  // namespace vote
