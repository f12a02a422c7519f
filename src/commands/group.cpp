#include "commands/group.hpp"

#include "commands/Args.hpp"
#include "commands/recommend.hpp"
#include "io/JsonIO.hpp"
#include "outing/Models.hpp"
#include "outing/Recommender.hpp"
#include "vote/BallotBuilder.hpp"
#include "vote/Condorcet.hpp"
#include "vote/VoteArtifact.hpp"

#include <filesystem>
#include <iostream>
#include <set>
#include <stdexcept>
#include <string>

namespace fs = std::filesystem;

static std::set<std::string> resolve_universe(const std::vector<outing::Activity>& catalog,
                                              const std::string& candidates_arg) {
    const std::set<std::string> all = vote::universe_of(catalog);
    if (candidates_arg.empty()) return all;

    std::set<std::string> out;
    for (const auto& id : split_csv(candidates_arg)) {
        if (all.find(id) == all.end()) throw std::runtime_error("unknown candidate in --candidates: " + id);
        out.insert(id);
    }
    return out;
}

void print_vote_result(const vote::VotingResult& res) {
    std::cout << "BALLOTS: " << res.ballot_count << "\n";
    std::cout << "WINNER: " << (res.winner ? *res.winner : std::string("(none)")) << "\n";
    std::cout << "CONDORCET_WINNER: " << (res.condorcet_winner ? "yes" : "no") << "\n";
    std::cout << "CYCLE_BROKEN: " << (res.cycle_broken ? "yes" : "no") << "\n";
    std::cout << "CRITERION: " << vote::criterion_str(res.criterion) << "\n";

    std::cout << "SMITH_SET:";
    for (const auto& id : res.smith_set) std::cout << " " << id;
    std::cout << "\n";

    int rank = 0;
    for (const auto& s : res.ranking) {
        std::cout << "  " << ++rank << ". " << s.id
                  << "  wins=" << s.wins << " losses=" << s.losses << " ties=" << s.ties
                  << " copeland=" << s.copeland << " margin_lost=" << s.margin_lost << "\n";
    }
}

int cmd_group(int argc, char** argv) {
    try {
        const fs::path catalog_path = get_arg(argc, argv, "--catalog", "data/catalog.json");
        const fs::path weather_path = get_arg(argc, argv, "--weather", "data/weather.json");
        const fs::path profiles_dir = get_arg(argc, argv, "--profiles", "data/profiles");
        const fs::path outdir = get_arg(argc, argv, "--outdir", "out");
        const std::string candidates_arg = get_arg(argc, argv, "--candidates", "");

        const outing::RecommendWeights weights = weights_from_args(argc, argv);
        const outing::RecommendConfig cfg = recommend_config_from_args(argc, argv);

        vote::BallotConfig ballot_cfg;
        ballot_cfg.tie_epsilon = get_arg_double(argc, argv, "--tie_epsilon", ballot_cfg.tie_epsilon);

        const std::vector<outing::Activity> catalog = loadCatalog(catalog_path.string());
        const outing::WeatherObservation obs = loadObservation(weather_path.string());
        const std::vector<outing::UserProfile> members = loadProfilesDir(profiles_dir.string());

        const std::set<std::string> universe = resolve_universe(catalog, candidates_arg);

        std::vector<vote::Ballot> ballots;
        ballots.reserve(members.size());
        for (const auto& m : members) {
            const auto ranked = outing::recommend(obs, catalog, m, weights, cfg);
            ballots.push_back(vote::build_ballot(m.user_id, ranked, universe, ballot_cfg));
        }

        vote::VoteArtifact artifact;
        artifact.source = profiles_dir.string();
        artifact.ballots = ballots;
        artifact.result = vote::resolve_vote(ballots);

        const fs::path out_path = outdir / "vote_result.json";
        artifact.write_to(out_path);

        std::cout << "MEMBERS: " << members.size() << "\n";
        std::cout << "CANDIDATES: " << universe.size() << "\n";
        std::cout << "OUT_VOTE: " << out_path.string() << "\n";
        print_vote_result(artifact.result);

        return 0;
    } catch (const std::exception& e) {
        std::cerr << "group failed: " << e.what() << "\n";
        return 1;
    }
}
