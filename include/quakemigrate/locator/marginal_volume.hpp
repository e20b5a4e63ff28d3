#pragma once

#include "quakemigrate/core/event.hpp"
#include "quakemigrate/lut/grid.hpp"
#include <vector>

namespace quakemigrate {

/**
 * MarginalVolume - Coalescence collapsed over time, one value per node,
 * and the location estimators working on it
 */
class MarginalVolume {
public:
    MarginalVolume(const Grid3D& grid, std::vector<double> values);

    const Grid3D& grid() const { return grid_; }
    const std::vector<double>& values() const { return values_; }

    // Global maximum; the lowest node index wins ties
    size_t peakNode() const { return peak_node_; }
    double peak() const { return values_[peak_node_]; }
    double minimum() const { return minimum_; }

    // Dynamic range at most tolerance times the peak
    bool isFlat(double tolerance) const;

    // Peak node refined per axis by a 3-point parabola (offset clamped to
    // half a node). Uncertainty is the Gaussian sigma implied by the width
    // of the profile through the peak at `fraction` of its height above
    // the volume minimum. Adds flat/boundary flags to `flags`.
    LocationEstimate quadraticEstimate(double fraction, double flat_tolerance,
                                       uint32_t& flags) const;

    // Least-squares fit of an axis-aligned 3-D Gaussian to the log values
    // within half_width nodes of the peak
    LocationEstimate gaussianEstimate(int half_width, uint32_t& flags) const;

    // Weighted mean and standard deviation of the nodes above `fraction` of
    // the peak height
    LocationEstimate covarianceEstimate(double fraction, uint32_t& flags) const;

    // Sub-node offset of the peak along one axis, in nodes
    double parabolicOffset(int axis) const;

    // Sigma along one axis; boundary is set when a crossing is missing
    double profileSigma(int axis, double fraction, bool& boundary) const;

    // Full extent of the grid along one axis (at least one spacing)
    double axisExtent(int axis) const;

private:
    Grid3D grid_;
    std::vector<double> values_;
    size_t peak_node_;
    double minimum_;

    double valueAt(const std::array<size_t, 3>& ijk) const {
        return values_[grid_.index(ijk[0], ijk[1], ijk[2])];
    }
};

} // namespace quakemigrate
