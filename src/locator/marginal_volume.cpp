#include "quakemigrate/locator/marginal_volume.hpp"
#include "quakemigrate/core/exception.hpp"
#include <Eigen/Dense>
#include <algorithm>
#include <cmath>

namespace quakemigrate {

MarginalVolume::MarginalVolume(const Grid3D& grid, std::vector<double> values)
    : grid_(grid)
    , values_(std::move(values))
    , peak_node_(0)
    , minimum_(0)
{
    if (values_.size() != grid_.nodeTotal() || values_.empty()) {
        throw ConfigError("locator: marginal volume does not match the grid");
    }
    minimum_ = values_[0];
    for (size_t n = 1; n < values_.size(); n++) {
        if (values_[n] > values_[peak_node_]) peak_node_ = n;
        minimum_ = std::min(minimum_, values_[n]);
    }
}

bool MarginalVolume::isFlat(double tolerance) const {
    double range = peak() - minimum_;
    return range <= tolerance * std::abs(peak());
}

double MarginalVolume::axisExtent(int axis) const {
    size_t n = grid_.count(axis);
    double extent = (n > 1 ? n - 1 : 1) * grid_.spacing()[axis];
    return extent;
}

double MarginalVolume::parabolicOffset(int axis) const {
    auto ijk = grid_.indices(peak_node_);
    size_t c = ijk[axis];
    if (c == 0 || c + 1 >= grid_.count(axis)) return 0.0;

    auto lo = ijk, hi = ijk;
    lo[axis] = c - 1;
    hi[axis] = c + 1;
    double y_lo = valueAt(lo);
    double y_0 = valueAt(ijk);
    double y_hi = valueAt(hi);

    double denom = y_lo - 2.0 * y_0 + y_hi;
    if (!(denom < 0)) return 0.0;
    double offset = 0.5 * (y_lo - y_hi) / denom;
    return std::clamp(offset, -0.5, 0.5);
}

double MarginalVolume::profileSigma(int axis, double fraction, bool& boundary) const {
    boundary = false;
    auto ijk = grid_.indices(peak_node_);
    const size_t c0 = ijk[axis];
    const size_t n = grid_.count(axis);

    auto profile = [&](size_t c) {
        auto p = ijk;
        p[axis] = c;
        return valueAt(p) - minimum_;
    };

    double top = profile(c0);
    double level = fraction * top;
    if (!(top > 0)) {
        boundary = true;
        return axisExtent(axis);
    }

    bool found_left = false, found_right = false;
    double left = 0, right = 0;
    for (size_t c = c0; c-- > 0;) {
        double p = profile(c);
        if (p <= level) {
            double above = profile(c + 1);
            left = c + (level - p) / (above - p);
            found_left = true;
            break;
        }
    }
    for (size_t c = c0 + 1; c < n; c++) {
        double p = profile(c);
        if (p <= level) {
            double above = profile(c - 1);
            right = (c - 1) + (above - level) / (above - p);
            found_right = true;
            break;
        }
    }

    if (!found_left || !found_right) {
        boundary = true;
        return axisExtent(axis);
    }

    double half_width = 0.5 * (right - left) * grid_.spacing()[axis];
    return half_width / std::sqrt(2.0 * std::log(1.0 / fraction));
}

LocationEstimate MarginalVolume::quadraticEstimate(double fraction, double flat_tolerance,
                                                   uint32_t& flags) const {
    LocationEstimate est;
    Point3 base = grid_.nodePosition(peak_node_);

    if (isFlat(flat_tolerance)) {
        flags |= QUALITY_FLAT_VOLUME;
        est.position = base;
        for (int axis = 0; axis < 3; axis++) est.uncertainty[axis] = axisExtent(axis);
        est.valid = true;
        return est;
    }

    const uint32_t boundary_flags[3] = {QUALITY_BOUNDARY_X, QUALITY_BOUNDARY_Y, QUALITY_BOUNDARY_Z};
    for (int axis = 0; axis < 3; axis++) {
        est.position[axis] = base[axis] + parabolicOffset(axis) * grid_.spacing()[axis];
        bool boundary = false;
        est.uncertainty[axis] = profileSigma(axis, fraction, boundary);
        if (boundary) flags |= boundary_flags[axis];
    }
    est.valid = true;
    return est;
}

LocationEstimate MarginalVolume::gaussianEstimate(int half_width, uint32_t& flags) const {
    LocationEstimate est;
    auto ijk = grid_.indices(peak_node_);
    Point3 base = grid_.nodePosition(peak_node_);

    size_t lo[3], hi[3];
    for (int axis = 0; axis < 3; axis++) {
        size_t hw = static_cast<size_t>(std::max(half_width, 1));
        lo[axis] = ijk[axis] > hw ? ijk[axis] - hw : 0;
        hi[axis] = std::min(ijk[axis] + hw, grid_.count(axis) - 1);
        if (hi[axis] - lo[axis] < 2) {
            flags |= QUALITY_GAUSSIAN_FAILED;
            return est;
        }
    }

    std::vector<std::array<double, 3>> coords;
    std::vector<double> logs;
    for (size_t i = lo[0]; i <= hi[0]; i++) {
        for (size_t j = lo[1]; j <= hi[1]; j++) {
            for (size_t k = lo[2]; k <= hi[2]; k++) {
                double v = values_[grid_.index(i, j, k)];
                if (!(v > 0)) continue;
                Point3 p = grid_.nodePosition(i, j, k);
                coords.push_back({p.x - base.x, p.y - base.y, p.z - base.z});
                logs.push_back(std::log(v));
            }
        }
    }
    if (coords.size() < 7) {
        flags |= QUALITY_GAUSSIAN_FAILED;
        return est;
    }

    // ln v = c + sum_a (b_a * x_a + a_a * x_a^2)
    Eigen::MatrixXd G(coords.size(), 7);
    Eigen::VectorXd d(coords.size());
    for (size_t r = 0; r < coords.size(); r++) {
        G(r, 0) = 1.0;
        for (int axis = 0; axis < 3; axis++) {
            G(r, 1 + 2 * axis) = coords[r][axis];
            G(r, 2 + 2 * axis) = coords[r][axis] * coords[r][axis];
        }
        d(r) = logs[r];
    }
    Eigen::VectorXd m = G.colPivHouseholderQr().solve(d);

    for (int axis = 0; axis < 3; axis++) {
        double b = m(1 + 2 * axis);
        double a = m(2 + 2 * axis);
        if (!std::isfinite(a) || !std::isfinite(b) || !(a < 0)) {
            flags |= QUALITY_GAUSSIAN_FAILED;
            return LocationEstimate();
        }
        est.position[axis] = base[axis] - b / (2.0 * a);
        est.uncertainty[axis] = std::sqrt(-1.0 / (2.0 * a));
    }

    if (!grid_.contains(est.position)) {
        flags |= QUALITY_GAUSSIAN_FAILED;
        return LocationEstimate();
    }
    est.valid = true;
    return est;
}

LocationEstimate MarginalVolume::covarianceEstimate(double fraction, uint32_t& flags) const {
    LocationEstimate est;
    double range = peak() - minimum_;
    if (!(range > 0)) {
        flags |= QUALITY_COVARIANCE_FAILED;
        return est;
    }
    double cutoff = fraction * range;

    Eigen::Vector3d mean = Eigen::Vector3d::Zero();
    Eigen::Matrix3d second = Eigen::Matrix3d::Zero();
    double total = 0;
    for (size_t n = 0; n < values_.size(); n++) {
        double w = values_[n] - minimum_;
        if (w < cutoff) continue;
        Point3 p = grid_.nodePosition(n);
        Eigen::Vector3d x(p.x, p.y, p.z);
        mean += w * x;
        second += w * x * x.transpose();
        total += w;
    }
    if (!(total > 0)) {
        flags |= QUALITY_COVARIANCE_FAILED;
        return est;
    }

    mean /= total;
    Eigen::Matrix3d cov = second / total - mean * mean.transpose();
    for (int axis = 0; axis < 3; axis++) {
        est.position[axis] = mean(axis);
        est.uncertainty[axis] = std::sqrt(std::max(cov(axis, axis), 0.0));
    }
    est.valid = true;
    return est;
}

} // namespace quakemigrate
