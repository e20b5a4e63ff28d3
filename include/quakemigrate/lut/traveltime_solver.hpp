#pragma once

#include "quakemigrate/lut/grid.hpp"
#include "quakemigrate/lut/velocity_model.hpp"
#include <array>
#include <vector>

namespace quakemigrate {

/**
 * GraphTraveltimeSolver - Shortest-path travel times on a node grid
 *
 * Every node is connected to the nodes of its forward star: all offsets
 * within `order` nodes on each axis whose components share no common factor
 * (longer collinear edges would duplicate shorter ones). The time along an
 * edge is its length times the mean slowness of the two end nodes, so every
 * edge costs a strictly positive time and first-arrival times grow along any
 * path away from the source.
 *
 * Nodes around the source are seeded with straight-line times before the
 * Dijkstra propagation, which keeps the near field accurate when the source
 * is off-node.
 */
class GraphTraveltimeSolver {
public:
    GraphTraveltimeSolver(const Grid3D& grid, int order);

    int order() const { return order_; }
    size_t edgesPerNode() const { return star_.size(); }

    // First-arrival time (s) from source to every node of the grid
    std::vector<double> solve(const Point3& source, const VelocityModel& model,
                              PhaseType phase) const;

private:
    Grid3D grid_;
    int order_;
    std::vector<std::array<int, 3>> star_;
    std::vector<double> star_length_;

    void buildForwardStar();
};

} // namespace quakemigrate
