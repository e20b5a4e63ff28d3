#include "quakemigrate/lut/lookup_table.hpp"
#include "quakemigrate/core/exception.hpp"
#include <cmath>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <sstream>

namespace quakemigrate {

namespace {

// One Grid2Time header: geometry line, then the source (station) line
struct NllHeader {
    std::array<size_t, 3> counts;
    Point3 origin;
    Point3 spacing;
    bool double_precision;
    Point3 station;
};

NllHeader readHeader(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("lut: cannot open NonLinLoc header " + path);
    }

    NllHeader hdr;
    std::string line;
    if (!std::getline(file, line)) throw ConfigError("lut: empty NonLinLoc header " + path);

    std::istringstream geometry(line);
    long long counts[3] = {0, 0, 0};
    std::string type, precision;
    geometry >> counts[0] >> counts[1] >> counts[2]
             >> hdr.origin.x >> hdr.origin.y >> hdr.origin.z
             >> hdr.spacing.x >> hdr.spacing.y >> hdr.spacing.z >> type;
    if (!geometry) throw ConfigError("lut: malformed grid line in " + path);
    geometry >> precision;

    if (type != "TIME") {
        throw ConfigError("lut: " + path + " holds a " + type + " grid, expected TIME");
    }
    if (!precision.empty() && precision != "FLOAT" && precision != "DOUBLE") {
        throw ConfigError("lut: unknown grid precision " + precision + " in " + path);
    }
    hdr.double_precision = precision == "DOUBLE";

    for (int axis = 0; axis < 3; axis++) {
        if (counts[axis] < 1 || counts[axis] > (1 << 24) || !(hdr.spacing[axis] > 0)) {
            throw ConfigError("lut: bad grid dimensions in " + path);
        }
        hdr.counts[axis] = static_cast<size_t>(counts[axis]);
    }

    std::string label;
    if (!std::getline(file, line)) throw ConfigError("lut: no station line in " + path);
    std::istringstream source(line);
    source >> label >> hdr.station.x >> hdr.station.y >> hdr.station.z;
    if (!source) throw ConfigError("lut: malformed station line in " + path);
    return hdr;
}

template <typename T>
std::vector<double> readBuffer(const std::string& path, size_t count) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file.is_open()) {
        throw ConfigError("lut: cannot open NonLinLoc buffer " + path);
    }
    const std::streamoff size = file.tellg();
    if (size != static_cast<std::streamoff>(count * sizeof(T))) {
        std::ostringstream msg;
        msg << "lut: " << path << " holds " << size << " bytes, header describes "
            << count * sizeof(T);
        throw ConfigError(msg.str());
    }
    file.seekg(0);

    std::vector<T> raw(count);
    file.read(reinterpret_cast<char*>(raw.data()), static_cast<std::streamsize>(size));
    if (!file) throw ConfigError("lut: error reading " + path);

    std::vector<double> values(raw.begin(), raw.end());
    for (double v : values) {
        if (!std::isfinite(v) || v < 0) {
            throw ConfigError("lut: invalid travel time in " + path);
        }
    }
    return values;
}

std::string stationCode(const std::string& id) {
    auto dot = id.rfind('.');
    return dot == std::string::npos ? id : id.substr(dot + 1);
}

} // anonymous namespace

void LookupTable::importNonLinLoc(const std::string& root,
                                  const std::vector<LutStation>& stations,
                                  const std::vector<PhaseType>& phases,
                                  const LutBuildOptions& options) {
    if (stations.empty()) throw ConfigError("lut: no stations");
    if (phases.empty()) throw ConfigError("lut: no phases");

    auto stem = [&](size_t s, size_t p) {
        return root + "." + phaseTypeToString(phases[p]) + "." +
               stationCode(stations[s].id) + ".time";
    };

    Grid3D grid;
    std::vector<LutStation> located = stations;
    std::vector<std::vector<double>> tables(stations.size() * phases.size());

    for (size_t s = 0; s < stations.size(); s++) {
        for (size_t p = 0; p < phases.size(); p++) {
            if (phases[p] == PhaseType::Unknown) throw ConfigError("lut: unknown phase");
            const std::string hdr_path = stem(s, p) + ".hdr";
            NllHeader hdr = readHeader(hdr_path);
            Grid3D this_grid(hdr.origin, hdr.spacing, hdr.counts);

            if (s == 0 && p == 0) {
                grid = this_grid;
                checkMemory(grid, stations.size(), phases.size(), options.takeoff_angles,
                            options.max_memory_mb);
            } else if (this_grid != grid) {
                throw ConfigError("lut: grid in " + hdr_path + " differs from " +
                                  stem(0, 0) + ".hdr");
            }
            if (p == 0) located[s].position = hdr.station;

            const std::string buf_path = stem(s, p) + ".buf";
            tables[s * phases.size() + p] = hdr.double_precision
                ? readBuffer<double>(buf_path, grid.nodeTotal())
                : readBuffer<float>(buf_path, grid.nodeTotal());
        }
    }

    grid_ = grid;
    stations_.swap(located);
    phases_ = phases;
    model_name_ = "nonlinloc";
    fraction_tt_ = options.fraction_tt;
    has_takeoff_ = options.takeoff_angles;
    tables_.swap(tables);
    takeoffs_.clear();
    if (has_takeoff_) {
        for (const auto& tt : tables_) takeoffs_.push_back(computeTakeoff(tt));
    }

    std::cout << "LUT: imported " << pairCount() << " NonLinLoc grids from " << root
              << std::endl;
}

} // namespace quakemigrate
