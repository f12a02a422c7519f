#include "commands/CatalogDump.hpp"
#include "commands/group.hpp"
#include "commands/recommend.hpp"
#include "commands/tally.hpp"

#include <iostream>
#include <string>

static int print_usage() {
    std::cerr
        << "usage:\n"
        << "  outing-agent catalog dump [path]\n"
        << "  outing-agent recommend [args]\n"
        << "  outing-agent group [args]\n"
        << "  outing-agent tally --ballots <path> [args]\n"
        << "  outing-agent help\n";
    return 1;
}

static int print_recommend_help() {
    std::cerr
        << "usage:\n"
        << "  outing-agent recommend [options]\n"
        << "\n"
        << "inputs/outputs:\n"
        << "  --catalog <path>             default: data/catalog.json\n"
        << "  --weather <path>             default: data/weather.json\n"
        << "  --profile <path>             default: data/profile.json\n"
        << "  --outdir <dir>               default: out\n"
        << "  --explain                    print per-activity explanations\n"
        << "\n"
        << "scoring:\n"
        << "  --weather_weight <f>         default: 0.4\n"
        << "  --preference_weight <f>      default: 0.6 (weights must sum to 1)\n"
        << "  --temp_margin <f>            default: 10 (degrees C)\n"
        << "  --half_life_days <f>         default: 30\n"
        << "  --air_quality                penalize outdoor activities by AQI\n"
        << "\n"
        << "selection:\n"
        << "  --top <n>                    default: 10\n"
        << "  --max_per_category <n>       default: 3 (0 disables)\n";
    return 0;
}

static int print_group_help() {
    std::cerr
        << "usage:\n"
        << "  outing-agent group [options]\n"
        << "\n"
        << "options:\n"
        << "  --catalog <path>             default: data/catalog.json\n"
        << "  --weather <path>             default: data/weather.json\n"
        << "  --profiles <dir>             default: data/profiles (one *.json per member)\n"
        << "  --candidates <id,id,...>     default: whole catalog\n"
        << "  --tie_epsilon <f>            default: 1e-9\n"
        << "  --outdir <dir>               default: out\n"
        << "  --weather_weight / --preference_weight / --air_quality as for recommend\n";
    return 0;
}

static int print_tally_help() {
    std::cerr
        << "usage:\n"
        << "  outing-agent tally --ballots <path> [--outdir <dir>]\n"
        << "\n"
        << "ballots file:\n"
        << "  {\"candidates\": [...], \"ballots\": [{\"voter\": \"...\", \"ranking\": [...]}]}\n";
    return 0;
}

int main(int argc, char** argv) {
    if (argc < 2) return print_usage();

    const std::string cmd = argv[1];

    if (cmd == "help") {
        return print_usage();
    }

    if (cmd == "catalog") {
        if (argc >= 3 && std::string(argv[2]) == "dump") {
            const std::string path = (argc >= 4) ? argv[3] : "data/catalog.json";
            return catalogDump(path);
        }
        return print_usage();
    }

    // subcommand help
    if (cmd == "recommend" && (argc >= 3 && std::string(argv[2]) == "--help")) return print_recommend_help();
    if (cmd == "group"     && (argc >= 3 && std::string(argv[2]) == "--help")) return print_group_help();
    if (cmd == "tally"     && (argc >= 3 && std::string(argv[2]) == "--help")) return print_tally_help();

    if (cmd == "recommend") return cmd_recommend(argc - 1, argv + 1);
    if (cmd == "group")     return cmd_group(argc - 1, argv + 1);
    if (cmd == "tally")     return cmd_tally(argc - 1, argv + 1);

    std::cerr << "unknown command\n";
    return print_usage();
}
