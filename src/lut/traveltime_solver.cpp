#include "quakemigrate/lut/traveltime_solver.hpp"
#include "quakemigrate/core/exception.hpp"
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <functional>
#include <limits>
#include <numeric>
#include <queue>
#include <utility>

namespace quakemigrate {

GraphTraveltimeSolver::GraphTraveltimeSolver(const Grid3D& grid, int order)
    : grid_(grid), order_(order)
{
    if (order_ < 1) {
        throw ConfigError("lut: graph forward-star order must be >= 1");
    }
    buildForwardStar();
}

void GraphTraveltimeSolver::buildForwardStar() {
    star_.clear();
    star_length_.clear();
    const Point3& h = grid_.spacing();

    for (int di = -order_; di <= order_; di++) {
        for (int dj = -order_; dj <= order_; dj++) {
            for (int dk = -order_; dk <= order_; dk++) {
                if (di == 0 && dj == 0 && dk == 0) continue;
                int g = std::gcd(std::gcd(std::abs(di), std::abs(dj)), std::abs(dk));
                if (g != 1) continue;
                star_.push_back({di, dj, dk});
                double dx = di * h.x, dy = dj * h.y, dz = dk * h.z;
                star_length_.push_back(std::sqrt(dx * dx + dy * dy + dz * dz));
            }
        }
    }
}

std::vector<double> GraphTraveltimeSolver::solve(const Point3& source,
                                                 const VelocityModel& model,
                                                 PhaseType phase) const {
    const size_t n = grid_.nodeTotal();
    const double inf = std::numeric_limits<double>::infinity();

    std::vector<double> slowness(n);
    for (size_t node = 0; node < n; node++) {
        double v = model.velocity(phase, grid_.nodePosition(node));
        if (!(v > 0)) {
            throw ConfigError("lut: velocity model '" + model.name() +
                              "' has a non-positive velocity inside the grid");
        }
        slowness[node] = 1.0 / v;
    }
    double v_src = model.velocity(phase, source);
    double s_src = v_src > 0 ? 1.0 / v_src : slowness[grid_.nearestNode(source)];

    std::vector<double> tt(n, inf);
    std::vector<char> done(n, 0);

    using Entry = std::pair<double, size_t>;
    std::priority_queue<Entry, std::vector<Entry>, std::greater<Entry>> heap;

    // Seed the cells around the source with straight-line times
    Point3 f = grid_.fractionalIndex(source);
    long lo[3], hi[3];
    for (int axis = 0; axis < 3; axis++) {
        long last = static_cast<long>(grid_.count(axis)) - 1;
        lo[axis] = std::clamp(static_cast<long>(std::floor(f[axis])) - 1, 0L, last);
        hi[axis] = std::clamp(static_cast<long>(std::ceil(f[axis])) + 1, 0L, last);
    }
    for (long i = lo[0]; i <= hi[0]; i++) {
        for (long j = lo[1]; j <= hi[1]; j++) {
            for (long k = lo[2]; k <= hi[2]; k++) {
                size_t node = grid_.index(i, j, k);
                double d = source.distanceTo(grid_.nodePosition(node));
                tt[node] = d * 0.5 * (s_src + slowness[node]);
                heap.push({tt[node], node});
            }
        }
    }

    const long nx = static_cast<long>(grid_.nx());
    const long ny = static_cast<long>(grid_.ny());
    const long nz = static_cast<long>(grid_.nz());

    while (!heap.empty()) {
        Entry top = heap.top();
        heap.pop();
        size_t node = top.second;
        if (done[node] || top.first > tt[node]) continue;
        done[node] = 1;

        auto ijk = grid_.indices(node);
        long i = static_cast<long>(ijk[0]);
        long j = static_cast<long>(ijk[1]);
        long k = static_cast<long>(ijk[2]);

        for (size_t e = 0; e < star_.size(); e++) {
            long ni = i + star_[e][0];
            long nj = j + star_[e][1];
            long nk = k + star_[e][2];
            if (ni < 0 || nj < 0 || nk < 0 || ni >= nx || nj >= ny || nk >= nz) continue;

            size_t next = grid_.index(ni, nj, nk);
            if (done[next]) continue;
            double t = tt[node] + star_length_[e] * 0.5 * (slowness[node] + slowness[next]);
            if (t < tt[next]) {
                tt[next] = t;
                heap.push({t, next});
            }
        }
    }

    return tt;
}

} // namespace quakemigrate
