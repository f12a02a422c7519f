#include "commands/CatalogDump.hpp"
#include "io/JsonIO.hpp"
#include "outing/Models.hpp"

#include <iostream>

int catalogDump(const std::string& catalogPath) {
    std::vector<outing::Activity> catalog;
    try {
        catalog = loadCatalog(catalogPath);
    } catch (const std::exception& e) {
        std::cerr << "[error] failed to load catalog: " << e.what() << "\n";
        return 1;
    }

    for (const auto& a : catalog) {
        const auto& t = a.tolerance;
        std::cout << "[" << (a.indoor ? "Indoor" : "Outdoor") << "] " << a.name
                  << " (" << a.id << (a.category.empty() ? "" : ", " + a.category) << ")\n";
        std::cout << "    temp: " << t.temp_min << ".." << t.temp_max << " C"
                  << "  wind<=" << t.max_wind_kmh << " km/h"
                  << "  precip<=" << t.max_precip_probability << "\n";
    }

    return 0;
}
