#include "quakemigrate/core/station.hpp"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <iostream>
#include <sstream>

namespace quakemigrate {

GeoPoint StationInventory::centroid() const {
    if (stations_.empty()) return GeoPoint();

    double lat = 0, sin_lon = 0, cos_lon = 0;
    for (const auto& [key, sta] : stations_) {
        lat += sta->location().latitude;
        sin_lon += std::sin(sta->location().longitude * constants::DEG_TO_RAD);
        cos_lon += std::cos(sta->location().longitude * constants::DEG_TO_RAD);
    }
    return GeoPoint(lat / stations_.size(),
                    std::atan2(sin_lon, cos_lon) * constants::RAD_TO_DEG);
}

void StationInventory::project(const Projection& projection) {
    for (auto& [key, sta] : stations_) {
        sta->setPosition(projection.forward(sta->location()));
    }
}

bool StationInventory::loadFromFile(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        std::cerr << "Cannot open station file: " << filename << std::endl;
        return false;
    }

    std::string line;
    int line_num = 0;
    int errors = 0;

    while (std::getline(file, line)) {
        line_num++;
        if (line.find_first_not_of(" \t\r") == std::string::npos) continue;
        if (line[line.find_first_not_of(" \t\r")] == '#') continue;

        std::replace(line.begin(), line.end(), ',', ' ');
        std::istringstream iss(line);
        std::string network, code;
        double lat = 0, lon = 0, elev = 0;

        if (!(iss >> network >> code >> lat >> lon)) {
            std::cerr << filename << ":" << line_num << ": expected network station "
                      << "latitude longitude [elevation]" << std::endl;
            errors++;
            continue;
        }
        if (!(iss >> elev)) elev = 0;

        if (lat < -90 || lat > 90 || lon < -180 || lon > 360) {
            std::cerr << filename << ":" << line_num << ": coordinates out of range"
                      << std::endl;
            errors++;
            continue;
        }

        auto sta = std::make_shared<Station>(network, code, lat, lon, elev);
        if (stations_.count(sta->key())) {
            std::cerr << filename << ":" << line_num << ": duplicate station "
                      << sta->key() << std::endl;
            errors++;
            continue;
        }
        addStation(sta);
    }

    return errors == 0 && !stations_.empty();
}

} // namespace quakemigrate
