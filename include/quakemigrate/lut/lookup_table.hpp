#pragma once

#include "quakemigrate/core/types.hpp"
#include "quakemigrate/lut/grid.hpp"
#include "quakemigrate/lut/velocity_model.hpp"
#include <array>
#include <memory>
#include <string>
#include <vector>

namespace quakemigrate {

// Station entry of a lookup table
struct LutStation {
    std::string id;         // "NET.STA"
    Point3 position;        // km, same frame as the grid

    LutStation() = default;
    LutStation(const std::string& id_, const Point3& pos) : id(id_), position(pos) {}
};

struct LutBuildOptions {
    int graph_order;
    bool takeoff_angles;
    double fraction_tt;
    double max_memory_mb;

    LutBuildOptions()
        : graph_order(3), takeoff_angles(false), fraction_tt(0.1), max_memory_mb(4096.0) {}
};

/**
 * LookupTable - Travel times from every grid node to every station, per phase
 *
 * Tables are stored per (station, phase) pair, pair index
 * station * phaseCount() + phase, each holding grid().nodeTotal() values in
 * node order. A built table is never modified; the migration and location
 * stages share it through a LookupTablePtr.
 */
class LookupTable {
public:
    LookupTable() : fraction_tt_(0.1), has_takeoff_(false) {}

    // Computes every table. Throws ResourceError if the tables would exceed
    // options.max_memory_mb, ConfigError on an unusable velocity model.
    void build(const Grid3D& grid,
               const std::vector<LutStation>& stations,
               const std::vector<PhaseType>& phases,
               const VelocityModel& model,
               const LutBuildOptions& options = LutBuildOptions());

    // Reads the <root>.<PHASE>.<STA>.time.hdr/.buf grids written by
    // NonLinLoc Grid2Time, STA being the station code without network. The
    // grid geometry and station positions come from the headers; every grid
    // must share one geometry. Throws ConfigError naming the offending file,
    // ResourceError past options.max_memory_mb.
    void importNonLinLoc(const std::string& root,
                         const std::vector<LutStation>& stations,
                         const std::vector<PhaseType>& phases,
                         const LutBuildOptions& options = LutBuildOptions());

    // Bytes needed for the tables of a grid/station/phase combination
    static double requiredBytes(size_t nodes, size_t stations, size_t phases, bool takeoff);

    // Throws ResourceError when requiredBytes() exceeds the limit
    static void checkMemory(const Grid3D& grid, size_t stations, size_t phases,
                            bool takeoff, double max_memory_mb);

    bool empty() const { return tables_.empty(); }
    const Grid3D& grid() const { return grid_; }
    const std::vector<LutStation>& stations() const { return stations_; }
    const std::vector<PhaseType>& phases() const { return phases_; }
    const std::string& velocityModelName() const { return model_name_; }

    size_t stationCount() const { return stations_.size(); }
    size_t phaseCount() const { return phases_.size(); }
    size_t pairCount() const { return stations_.size() * phases_.size(); }
    size_t pairIndex(size_t station, size_t phase) const {
        return station * phases_.size() + phase;
    }

    // -1 when not present
    int stationIndex(const std::string& id) const;
    int phaseIndex(PhaseType phase) const;

    const std::vector<double>& traveltimes(size_t station, size_t phase) const {
        return tables_[pairIndex(station, phase)];
    }

    double traveltime(size_t station, size_t phase, size_t node) const {
        return tables_[pairIndex(station, phase)][node];
    }

    // Trilinear interpolation, the point clamped into the grid
    double traveltimeAt(size_t station, size_t phase, const Point3& p) const;

    bool hasTakeoffAngles() const { return has_takeoff_; }

    // Degrees from the downward vertical at the node, toward the station
    double takeoff(size_t station, size_t phase, size_t node) const {
        return takeoffs_[pairIndex(station, phase)][node];
    }

    double maxTraveltime() const;

    double fractionTT() const { return fraction_tt_; }
    void setFractionTT(double f) { fraction_tt_ = f; }

    size_t memoryBytes() const;

    // Table on a grid keeping every n-th node per axis
    LookupTable decimate(const std::array<int, 3>& factors) const;

    // Binary format; load leaves the table untouched on failure
    bool save(const std::string& filename) const;
    bool load(const std::string& filename);

private:
    Grid3D grid_;
    std::vector<LutStation> stations_;
    std::vector<PhaseType> phases_;
    std::string model_name_;
    double fraction_tt_;
    bool has_takeoff_;
    std::vector<std::vector<double>> tables_;
    std::vector<std::vector<double>> takeoffs_;

    std::vector<double> computeTakeoff(const std::vector<double>& tt) const;
};

using LookupTablePtr = std::shared_ptr<const LookupTable>;

} // namespace quakemigrate
