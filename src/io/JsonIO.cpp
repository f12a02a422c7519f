#include "io/JsonIO.hpp"

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;
namespace fs = std::filesystem;

static void require_object(const json& j, const std::string& where) {
    if (!j.is_object()) {
        throw std::runtime_error(where + " must be an object");
    }
}

static void require_array(const json& j, const std::string& where) {
    if (!j.is_array()) {
        throw std::runtime_error(where + " must be an array");
    }
}

static const json& require_field(const json& j, const char* key, const std::string& where) {
    if (!j.contains(key)) {
        throw std::runtime_error(where + " missing required field: " + std::string(key));
    }
    return j.at(key);
}

static std::string require_string(const json& j, const char* key, const std::string& where) {
    const json& v = require_field(j, key, where);
    if (!v.is_string()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be a string");
    }
    return v.get<std::string>();
}

static double require_number(const json& j, const char* key, const std::string& where) {
    const json& v = require_field(j, key, where);
    if (!v.is_number()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be a number");
    }
    return v.get<double>();
}

// Integral JSON number that fits in an int; 0.9 or 1e12 are rejected rather than truncated.
static int require_int(const json& j, const char* key, const std::string& where) {
    const json& v = require_field(j, key, where);
    const std::string path = where + "." + std::string(key);
    if (!v.is_number_integer()) {
        throw std::runtime_error(path + " must be an integer");
    }

    if (v.is_number_unsigned()) {
        const std::uint64_t u = v.get<std::uint64_t>();
        if (u > static_cast<std::uint64_t>(std::numeric_limits<int>::max())) {
            throw std::runtime_error(path + " is out of range");
        }
        return static_cast<int>(u);
    }

    const std::int64_t x = v.get<std::int64_t>();
    if (x < std::numeric_limits<int>::min() || x > std::numeric_limits<int>::max()) {
        throw std::runtime_error(path + " is out of range");
    }
    return static_cast<int>(x);
}

static std::vector<std::string> string_array(const json& arr, const std::string& where) {
    require_array(arr, where);
    std::vector<std::string> out;
    out.reserve(arr.size());
    for (size_t i = 0; i < arr.size(); ++i) {
        if (!arr.at(i).is_string()) {
            std::ostringstream oss;
            oss << where << "[" << i << "] must be a string";
            throw std::runtime_error(oss.str());
        }
        out.push_back(arr.at(i).get<std::string>());
    }
    return out;
}

static std::string index_path(const std::string& where, size_t i) {
    std::ostringstream oss;
    oss << where << "[" << i << "]";
    return oss.str();
}

nlohmann::json readJsonFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("failed to open JSON file: " + path);
    }

    json j;
    try {
        in >> j;
    } catch (const std::exception& e) {
        throw std::runtime_error("failed to parse JSON in " + path + ": " + e.what());
    }
    return j;
}

static outing::Activity parseActivity(const json& j, const std::string& where) {
    require_object(j, where);

    outing::Activity a;
    a.id       = require_string(j, "id", where);
    a.name     = j.contains("name") ? require_string(j, "name", where) : a.id;
    a.category = j.contains("category") ? require_string(j, "category", where) : "";

    if (j.contains("indoor")) {
        if (!j.at("indoor").is_boolean()) throw std::runtime_error(where + ".indoor must be a boolean");
        a.indoor = j.at("indoor").get<bool>();
    }

    const std::string tw = where + ".tolerance";
    const json& t = require_field(j, "tolerance", where);
    require_object(t, tw);
    a.tolerance.temp_min               = require_number(t, "temp_min", tw);
    a.tolerance.temp_max               = require_number(t, "temp_max", tw);
    a.tolerance.max_wind_kmh           = require_number(t, "max_wind_kmh", tw);
    a.tolerance.max_precip_probability = require_number(t, "max_precip_probability", tw);

    return a;
}

std::vector<outing::Activity> parseCatalog(const json& j) {
    require_object(j, "root");

    const json& arr = require_field(j, "activities", "root");
    require_array(arr, "root.activities");

    std::vector<outing::Activity> out;
    out.reserve(arr.size());
    for (size_t i = 0; i < arr.size(); ++i) {
        out.push_back(parseActivity(arr.at(i), index_path("root.activities", i)));
    }
    return out;
}

outing::WeatherObservation parseObservation(const json& j) {
    require_object(j, "root");

    outing::WeatherObservation w;
    w.location           = j.value("location", "");
    w.timestamp          = j.value("timestamp", "");
    w.temperature_c      = require_number(j, "temperature_c", "root");
    w.wind_kmh           = require_number(j, "wind_kmh", "root");
    w.precip_probability = require_number(j, "precip_probability", "root");

    if (j.contains("air_quality_index") && !j.at("air_quality_index").is_null()) {
        w.air_quality_index = require_number(j, "air_quality_index", "root");
    }
    return w;
}

outing::UserProfile parseProfile(const json& j) {
    require_object(j, "root");

    outing::UserProfile p;
    p.user_id = require_string(j, "user_id", "root");

    if (j.contains("favorites")) {
        const json& fav = j.at("favorites");
        require_object(fav, "root.favorites");
        for (auto it = fav.begin(); it != fav.end(); ++it) {
            if (!it.value().is_number()) {
                throw std::runtime_error("root.favorites." + it.key() + " must be a number");
            }
            p.favorites[it.key()] = it.value().get<double>();
        }
    }

    if (j.contains("history")) {
        const json& hist = j.at("history");
        require_object(hist, "root.history");
        for (auto it = hist.begin(); it != hist.end(); ++it) {
            const std::string hw = "root.history." + it.key();
            require_object(it.value(), hw);

            outing::HistoryEntry h;
            h.count           = require_int(it.value(), "count", hw);
            h.days_since_last = require_number(it.value(), "days_since_last", hw);
            p.history[it.key()] = h;
        }
    }

    if (j.contains("exclusions")) {
        for (auto& id : string_array(j.at("exclusions"), "root.exclusions")) p.exclusions.insert(id);
    }

    return p;
}

BallotFile parseBallotFile(const json& j) {
    require_object(j, "root");

    BallotFile bf;
    bf.candidates = string_array(require_field(j, "candidates", "root"), "root.candidates");

    const json& arr = require_field(j, "ballots", "root");
    require_array(arr, "root.ballots");

    for (size_t i = 0; i < arr.size(); ++i) {
        const std::string where = index_path("root.ballots", i);
        require_object(arr.at(i), where);

        RankingEntry r;
        r.voter_id = arr.at(i).value("voter", "voter-" + std::to_string(i + 1));
        r.ranking = string_array(require_field(arr.at(i), "ranking", where), where + ".ranking");
        bf.rankings.push_back(std::move(r));
    }
    return bf;
}

std::vector<outing::Activity> loadCatalog(const std::string& path) {
    return parseCatalog(readJsonFile(path));
}

outing::WeatherObservation loadObservation(const std::string& path) {
    return parseObservation(readJsonFile(path));
}

outing::UserProfile loadProfile(const std::string& path) {
    return parseProfile(readJsonFile(path));
}

std::vector<outing::UserProfile> loadProfilesDir(const std::string& dir) {
    if (!fs::is_directory(dir)) {
        throw std::runtime_error("profiles directory does not exist: " + dir);
    }

    std::vector<fs::path> files;
    for (const auto& entry : fs::directory_iterator(dir)) {
        if (entry.is_regular_file() && entry.path().extension() == ".json") files.push_back(entry.path());
    }
    std::sort(files.begin(), files.end());

    std::vector<outing::UserProfile> out;
    out.reserve(files.size());
    for (const auto& f : files) {
        try {
            out.push_back(loadProfile(f.string()));
        } catch (const std::exception& e) {
            throw std::runtime_error(f.string() + ": " + e.what());
        }
    }
    return out;
}

BallotFile loadBallotFile(const std::string& path) {
    return parseBallotFile(readJsonFile(path));
}
