#include "vote/VoteArtifact.hpp"

#include <fstream>
#include <stdexcept>

namespace vote {

static nlohmann::json standing_to_json(const CandidateStanding& s) {
    return {
        {"id", s.id},
        {"wins", s.wins},
        {"losses", s.losses},
        {"ties", s.ties},
        {"copeland", s.copeland},
        {"margin_lost", s.margin_lost}
    };
}

// prefer[a][b] as a nested object keyed by candidate id
static nlohmann::json tally_to_json(const PairwiseTally& t) {
    nlohmann::json j = nlohmann::json::object();
    for (size_t a = 0; a < t.size(); ++a) {
        nlohmann::json row = nlohmann::json::object();
        for (size_t b = 0; b < t.size(); ++b) {
            if (a != b) row[t.candidates()[b]] = t.prefer(a, b);
        }
        j[t.candidates()[a]] = row;
    }
    return j;
}

nlohmann::json VoteArtifact::to_json() const {
    nlohmann::json j;

    j["source"] = source;
    j["ballot_count"] = result.ballot_count;

    nlohmann::json bal = nlohmann::json::array();
    for (const auto& b : ballots) {
        bal.push_back({{"voter_id", b.voter_id}, {"tiers", b.tiers}});
    }
    j["ballots"] = bal;

    j["winner"] = result.winner ? nlohmann::json(*result.winner) : nlohmann::json(nullptr);
    j["condorcet_winner"] = result.condorcet_winner;
    j["cycle_broken"] = result.cycle_broken;
    j["criterion"] = criterion_str(result.criterion);

    nlohmann::json ranking = nlohmann::json::array();
    for (const auto& s : result.ranking) ranking.push_back(standing_to_json(s));
    j["ranking"] = ranking;

    j["smith_set"] = result.smith_set;
    j["pairwise"] = tally_to_json(result.tally);

    return j;
}

void VoteArtifact::write_to(const std::filesystem::path& out_path) const {
    if (out_path.has_parent_path()) std::filesystem::create_directories(out_path.parent_path());

    std::ofstream out(out_path);
    if (!out) throw std::runtime_error("Failed to open output file: " + out_path.string());

    out << to_json().dump(2) << "\n";
}

}  // namespace vote
