#pragma once

#include "types.hpp"
#include "projection.hpp"
#include <map>
#include <memory>

namespace quakemigrate {

/**
 * Station - Recording site with its geographic and grid position
 *
 * Elevation is in metres above sea level; the grid position carries it as
 * a negative depth in km until project() replaces it.
 */
class Station {
public:
    Station() : elevation_(0) {}

    Station(const std::string& network, const std::string& code,
            double lat, double lon, double elev = 0)
        : network_(network), code_(code)
        , location_(lat, lon, -elev / 1000.0), elevation_(elev)
        , position_(0, 0, -elev / 1000.0) {}

    const std::string& network() const { return network_; }
    const std::string& code() const { return code_; }
    std::string key() const { return network_ + "." + code_; }
    const GeoPoint& location() const { return location_; }
    double elevation() const { return elevation_; }

    const Point3& position() const { return position_; }
    void setPosition(const Point3& p) { position_ = p; }

    StreamID streamId(const std::string& location, const std::string& channel) const {
        return StreamID(network_, code_, location, channel);
    }

private:
    std::string network_;
    std::string code_;
    GeoPoint location_;
    double elevation_;
    Point3 position_;
};

using StationPtr = std::shared_ptr<Station>;

/**
 * StationInventory - Stations keyed by "NET.STA"
 */
class StationInventory {
public:
    // Replaces any station with the same key
    void addStation(StationPtr station) { stations_[station->key()] = station; }

    StationPtr getStation(const std::string& key) const {
        auto it = stations_.find(key);
        return it != stations_.end() ? it->second : nullptr;
    }

    const std::map<std::string, StationPtr>& stations() const { return stations_; }
    size_t size() const { return stations_.size(); }
    bool empty() const { return stations_.empty(); }

    // Mean latitude and longitude; the longitude mean is taken on the circle
    // so networks across the antimeridian stay together
    GeoPoint centroid() const;

    // Assigns every station its grid position
    void project(const Projection& projection);

    // Rows of "network station latitude longitude [elevation_m]", separated
    // by blanks or commas. False if the file cannot be read, a row is
    // malformed, a key repeats, or no station was found.
    bool loadFromFile(const std::string& filename);

private:
    std::map<std::string, StationPtr> stations_;
};

} // namespace quakemigrate
