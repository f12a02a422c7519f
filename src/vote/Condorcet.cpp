#include "vote/Condorcet.hpp"

#include <algorithm>

#include "outing/Errors.hpp"

namespace vote {

const char* criterion_str(RankingCriterion c) {
    switch (c) {
        case RankingCriterion::Wins: return "wins";
        case RankingCriterion::Copeland: return "copeland";
        default: return "unknown";
    }
}

std::vector<CandidateStanding> compute_standings(const PairwiseTally& tally) {
    const size_t n = tally.size();

    std::vector<CandidateStanding> out;
    out.reserve(n);

    for (size_t a = 0; a < n; ++a) {
        CandidateStanding s;
        s.id = tally.candidates()[a];

        for (size_t b = 0; b < n; ++b) {
            if (a == b) continue;
            const int m = tally.margin(a, b);
            if (m > 0) {
                ++s.wins;
            } else if (m < 0) {
                ++s.losses;
                s.margin_lost += -m;
            } else {
                ++s.ties;
            }
        }
        s.copeland = s.wins - s.losses;
        out.push_back(std::move(s));
    }
    return out;
}

static bool by_wins(const CandidateStanding& a, const CandidateStanding& b) {
    if (a.wins != b.wins) return a.wins > b.wins;
    if (a.margin_lost != b.margin_lost) return a.margin_lost < b.margin_lost;
    return a.id < b.id;
}

static bool by_copeland(const CandidateStanding& a, const CandidateStanding& b) {
    if (a.copeland != b.copeland) return a.copeland > b.copeland;
    if (a.margin_lost != b.margin_lost) return a.margin_lost < b.margin_lost;
    return a.id < b.id;
}

std::vector<std::string> compute_smith_set(const PairwiseTally& tally) {
    const size_t n = tally.size();
    if (n == 0) return {};

    // Every dominating set is a prefix of the Copeland order, so the smallest
    // dominating prefix is the Smith set.
    std::vector<CandidateStanding> order = compute_standings(tally);
    std::sort(order.begin(), order.end(), by_copeland);

    std::vector<size_t> idx;
    idx.reserve(n);
    for (const auto& s : order) idx.push_back(*tally.index_of(s.id));

    size_t k = 1;
    for (; k < n; ++k) {
        bool dominates = true;
        for (size_t i = 0; i < k && dominates; ++i) {
            for (size_t j = k; j < n; ++j) {
                if (!tally.beats(idx[i], idx[j])) {
                    dominates = false;
                    break;
                }
            }
        }
        if (dominates) break;
    }

    std::vector<std::string> out;
    out.reserve(k);
    for (size_t i = 0; i < k; ++i) out.push_back(order[i].id);
    std::sort(out.begin(), out.end());
    return out;
}

VotingResult resolve_tally(const PairwiseTally& tally) {
    if (tally.ballot_count() == 0) throw outing::EmptyBallotSet("no ballots to resolve");
    if (tally.size() == 0) throw outing::EmptyCandidateSet("no candidates to vote on");

    VotingResult res;
    res.ballot_count = tally.ballot_count();
    res.tally = tally;
    res.ranking = compute_standings(tally);
    res.smith_set = compute_smith_set(tally);

    const int others = static_cast<int>(tally.size()) - 1;
    const bool has_condorcet = std::any_of(res.ranking.begin(), res.ranking.end(),
                                           [others](const CandidateStanding& s) { return s.wins == others; });

    if (has_condorcet) {
        std::sort(res.ranking.begin(), res.ranking.end(), by_wins);
        res.criterion = RankingCriterion::Wins;
        res.condorcet_winner = true;
        res.cycle_broken = false;
    } else {
        std::sort(res.ranking.begin(), res.ranking.end(), by_copeland);
        res.criterion = RankingCriterion::Copeland;
        res.condorcet_winner = false;
        res.cycle_broken = true;
    }

    res.winner = res.ranking.front().id;
    return res;
}

VotingResult resolve_vote(const std::vector<Ballot>& ballots) {
    return resolve_tally(PairwiseTally::from_ballots(ballots));
}

}  // namespace vote
