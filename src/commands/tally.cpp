#include "commands/tally.hpp"

#include "commands/Args.hpp"
#include "commands/group.hpp"
#include "io/JsonIO.hpp"
#include "vote/BallotBuilder.hpp"
#include "vote/Condorcet.hpp"
#include "vote/VoteArtifact.hpp"

#include <filesystem>
#include <iostream>
#include <set>
#include <string>

namespace fs = std::filesystem;

int cmd_tally(int argc, char** argv) {
    const std::string ballots_path = get_arg(argc, argv, "--ballots", "");
    if (ballots_path.empty()) {
        std::cerr << "error: missing --ballots\n";
        return 1;
    }

    try {
        const fs::path outdir = get_arg(argc, argv, "--outdir", "out");

        const BallotFile bf = loadBallotFile(ballots_path);
        const std::set<std::string> universe(bf.candidates.begin(), bf.candidates.end());

        std::vector<vote::Ballot> ballots;
        ballots.reserve(bf.rankings.size());
        for (const auto& r : bf.rankings) {
            ballots.push_back(vote::ballot_from_ranking(r.voter_id, r.ranking, universe));
        }

        vote::VoteArtifact artifact;
        artifact.source = ballots_path;
        artifact.ballots = ballots;
        artifact.result = vote::resolve_vote(ballots);

        const fs::path out_path = outdir / "vote_result.json";
        artifact.write_to(out_path);

        std::cout << "CANDIDATES: " << universe.size() << "\n";
        std::cout << "OUT_VOTE: " << out_path.string() << "\n";
        print_vote_result(artifact.result);

        return 0;
    } catch (const std::exception& e) {
        std::cerr << "tally failed: " << e.what() << "\n";
        return 1;
    }
}
