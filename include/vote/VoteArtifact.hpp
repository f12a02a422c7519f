#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"
#include "vote/Ballot.hpp"
#include "vote/Condorcet.hpp"

namespace vote {

struct VoteArtifact {
    std::string source;              // ballots file or profiles dir
    std::vector<Ballot> ballots;
    VotingResult result;

    nlohmann::json to_json() const;
    void write_to(const std::filesystem::path& out_path) const;
};

}  // namespace vote
