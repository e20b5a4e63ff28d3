#include "quakemigrate/lut/grid.hpp"
#include "quakemigrate/core/exception.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>

namespace quakemigrate {

namespace {

const char* AXIS_NAMES[3] = {"x", "y", "z"};

} // anonymous namespace

Grid3D::Grid3D() : counts_{0, 0, 0} {}

Grid3D::Grid3D(const Point3& ll_corner, const Point3& ur_corner, const Point3& node_spacing)
    : ll_(ll_corner)
    , spacing_(node_spacing)
    , counts_{0, 0, 0}
{
    for (int axis = 0; axis < 3; axis++) {
        if (!(node_spacing[axis] > 0)) {
            std::ostringstream msg;
            msg << "grid: node spacing on " << AXIS_NAMES[axis]
                << " axis must be positive (got " << node_spacing[axis] << ")";
            throw ConfigError(msg.str());
        }
        if (!(ur_corner[axis] > ll_corner[axis])) {
            std::ostringstream msg;
            msg << "grid: upper-right corner must exceed lower-left corner on "
                << AXIS_NAMES[axis] << " axis (" << ll_corner[axis]
                << " >= " << ur_corner[axis] << ")";
            throw ConfigError(msg.str());
        }
        double span = (ur_corner[axis] - ll_corner[axis]) / node_spacing[axis];
        counts_[axis] = static_cast<size_t>(std::floor(span + 1e-9)) + 1;
    }
}

Grid3D::Grid3D(const Point3& ll, const Point3& spacing, const std::array<size_t, 3>& counts)
    : ll_(ll), spacing_(spacing), counts_(counts) {}

Point3 Grid3D::urCorner() const {
    if (nodeTotal() == 0) return ll_;
    return nodePosition(counts_[0] - 1, counts_[1] - 1, counts_[2] - 1);
}

size_t Grid3D::nearestNode(const Point3& p) const {
    Point3 f = fractionalIndex(p);
    size_t ijk[3];
    for (int axis = 0; axis < 3; axis++) {
        double r = std::round(f[axis]);
        double hi = static_cast<double>(counts_[axis]) - 1;
        ijk[axis] = static_cast<size_t>(std::clamp(r, 0.0, hi));
    }
    return index(ijk[0], ijk[1], ijk[2]);
}

bool Grid3D::contains(const Point3& p) const {
    Point3 ur = urCorner();
    const double eps = 1e-9;
    for (int axis = 0; axis < 3; axis++) {
        if (p[axis] < ll_[axis] - eps || p[axis] > ur[axis] + eps) return false;
    }
    return true;
}

Grid3D Grid3D::decimate(const std::array<int, 3>& factors) const {
    Point3 spacing;
    std::array<size_t, 3> counts;
    for (int axis = 0; axis < 3; axis++) {
        if (factors[axis] < 1) {
            throw ConfigError(std::string("grid: decimation factor on ") +
                              AXIS_NAMES[axis] + " axis must be >= 1");
        }
        size_t f = static_cast<size_t>(factors[axis]);
        spacing[axis] = spacing_[axis] * f;
        counts[axis] = (counts_[axis] - 1) / f + 1;
    }
    return Grid3D(ll_, spacing, counts);
}

} // namespace quakemigrate
