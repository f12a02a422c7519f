#pragma once

#include <string>
#include <vector>

#include "nlohmann/json.hpp"
#include "outing/Models.hpp"

struct RankingEntry {
    std::string voter_id;
    std::vector<std::string> ranking;   // best first
};

struct BallotFile {
    std::vector<std::string> candidates;
    std::vector<RankingEntry> rankings;
};

// All loaders throw std::runtime_error naming the offending JSON path.
nlohmann::json readJsonFile(const std::string& path);

std::vector<outing::Activity> parseCatalog(const nlohmann::json& j);
outing::WeatherObservation parseObservation(const nlohmann::json& j);
outing::UserProfile parseProfile(const nlohmann::json& j);
BallotFile parseBallotFile(const nlohmann::json& j);

std::vector<outing::Activity> loadCatalog(const std::string& path);
outing::WeatherObservation loadObservation(const std::string& path);
outing::UserProfile loadProfile(const std::string& path);

// Every *.json file in dir, sorted by file name.
std::vector<outing::UserProfile> loadProfilesDir(const std::string& dir);

BallotFile loadBallotFile(const std::string& path);
