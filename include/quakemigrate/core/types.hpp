#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <chrono>
#include <cmath>
#include <limits>

namespace quakemigrate {

// Times are handled at microsecond precision
using TimePoint = std::chrono::system_clock::time_point;
using Duration = std::chrono::microseconds;

using Sample = double;
using SampleVector = std::vector<Sample>;

// Offset a time point by a (possibly fractional) number of seconds
inline TimePoint addSeconds(TimePoint t, double seconds) {
    return t + std::chrono::duration_cast<TimePoint::duration>(
        Duration(static_cast<int64_t>(std::llround(seconds * 1e6))));
}

// Signed number of seconds from a to b
inline double secondsBetween(TimePoint a, TimePoint b) {
    return std::chrono::duration<double>(b - a).count();
}

// Cartesian position in km (x east, y north, z depth positive down)
struct Point3 {
    double x;
    double y;
    double z;

    Point3() : x(0), y(0), z(0) {}
    Point3(double x_, double y_, double z_) : x(x_), y(y_), z(z_) {}

    double operator[](int axis) const { return axis == 0 ? x : (axis == 1 ? y : z); }
    double& operator[](int axis) { return axis == 0 ? x : (axis == 1 ? y : z); }

    double distanceTo(const Point3& other) const {
        double dx = other.x - x;
        double dy = other.y - y;
        double dz = other.z - z;
        return std::sqrt(dx * dx + dy * dy + dz * dz);
    }

    double horizontalDistanceTo(const Point3& other) const {
        double dx = other.x - x;
        double dy = other.y - y;
        return std::sqrt(dx * dx + dy * dy);
    }

    bool operator==(const Point3& other) const {
        return x == other.x && y == other.y && z == other.z;
    }
    bool operator!=(const Point3& other) const { return !(*this == other); }
};

// Geographic position; depth in km, positive down
struct GeoPoint {
    double latitude;
    double longitude;
    double depth;

    GeoPoint() : latitude(0), longitude(0), depth(0) {}
    GeoPoint(double lat, double lon, double dep = 0)
        : latitude(lat), longitude(lon), depth(dep) {}
};

// Stream identifier (SEED convention)
struct StreamID {
    std::string network;
    std::string station;
    std::string location;
    std::string channel;

    StreamID() = default;
    StreamID(const std::string& net, const std::string& sta,
             const std::string& loc, const std::string& chan)
        : network(net), station(sta), location(loc), channel(chan) {}

    std::string toString() const {
        return network + "." + station + "." + location + "." + channel;
    }

    // "NET.STA", the key stations are stored under
    std::string stationKey() const { return network + "." + station; }

    // Component letter (last character of the channel code)
    char component() const { return channel.empty() ? '?' : channel.back(); }

    bool operator==(const StreamID& other) const {
        return network == other.network && station == other.station &&
               location == other.location && channel == other.channel;
    }

    bool operator<(const StreamID& other) const {
        if (network != other.network) return network < other.network;
        if (station != other.station) return station < other.station;
        if (location != other.location) return location < other.location;
        return channel < other.channel;
    }
};

enum class PhaseType {
    P,
    S,
    Unknown
};

inline std::string phaseTypeToString(PhaseType pt) {
    switch (pt) {
        case PhaseType::P: return "P";
        case PhaseType::S: return "S";
        default: return "?";
    }
}

inline PhaseType stringToPhaseType(const std::string& s) {
    if (s == "P") return PhaseType::P;
    if (s == "S") return PhaseType::S;
    return PhaseType::Unknown;
}

namespace constants {
    constexpr double DEG_TO_RAD = M_PI / 180.0;
    constexpr double RAD_TO_DEG = 180.0 / M_PI;
    constexpr double KM_PER_DEG = 111.195;
}

} // namespace quakemigrate
