#pragma once

#include "quakemigrate/core/types.hpp"
#include <array>
#include <cstddef>

namespace quakemigrate {

/**
 * Grid3D - Regular 3-D node grid in local Cartesian coordinates (km)
 *
 * Nodes are numbered with x slowest and z fastest:
 *   index(i, j, k) = (i * ny + j) * nz + k
 */
class Grid3D {
public:
    Grid3D();

    // Throws ConfigError naming the axis if ur <= ll or spacing <= 0
    Grid3D(const Point3& ll_corner, const Point3& ur_corner, const Point3& node_spacing);

    const Point3& llCorner() const { return ll_; }
    const Point3& spacing() const { return spacing_; }
    Point3 urCorner() const;

    size_t nx() const { return counts_[0]; }
    size_t ny() const { return counts_[1]; }
    size_t nz() const { return counts_[2]; }
    size_t count(int axis) const { return counts_[axis]; }
    size_t nodeTotal() const { return counts_[0] * counts_[1] * counts_[2]; }

    size_t index(size_t i, size_t j, size_t k) const {
        return (i * counts_[1] + j) * counts_[2] + k;
    }

    std::array<size_t, 3> indices(size_t node) const {
        size_t k = node % counts_[2];
        size_t j = (node / counts_[2]) % counts_[1];
        size_t i = node / (counts_[1] * counts_[2]);
        return {i, j, k};
    }

    Point3 nodePosition(size_t i, size_t j, size_t k) const {
        return Point3(ll_.x + i * spacing_.x,
                      ll_.y + j * spacing_.y,
                      ll_.z + k * spacing_.z);
    }

    Point3 nodePosition(size_t node) const {
        auto ijk = indices(node);
        return nodePosition(ijk[0], ijk[1], ijk[2]);
    }

    // Continuous node coordinates of a point (unclamped)
    Point3 fractionalIndex(const Point3& p) const {
        return Point3((p.x - ll_.x) / spacing_.x,
                      (p.y - ll_.y) / spacing_.y,
                      (p.z - ll_.z) / spacing_.z);
    }

    // Closest node, clamped to the grid
    size_t nearestNode(const Point3& p) const;

    bool contains(const Point3& p) const;

    // Grid keeping every n-th node per axis, same lower corner
    Grid3D decimate(const std::array<int, 3>& factors) const;

    bool operator==(const Grid3D& other) const {
        return ll_ == other.ll_ && spacing_ == other.spacing_ && counts_ == other.counts_;
    }
    bool operator!=(const Grid3D& other) const { return !(*this == other); }

private:
    Point3 ll_;
    Point3 spacing_;
    std::array<size_t, 3> counts_;

    // Used by decimate and deserialisation
    Grid3D(const Point3& ll, const Point3& spacing, const std::array<size_t, 3>& counts);

    friend class LookupTable;
};

} // namespace quakemigrate
