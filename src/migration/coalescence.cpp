#include "quakemigrate/migration/coalescence.hpp"
#include "quakemigrate/core/exception.hpp"
#include <algorithm>
#include <sstream>

namespace quakemigrate {

void CoalescenceVolume::allocate(size_t ticks, size_t nodes, TimePoint start,
                                 double sampling_rate, double max_memory_mb) {
    double mb = requiredMegabytes(ticks, nodes);
    if (mb > max_memory_mb) {
        std::ostringstream msg;
        msg << "coalescence volume of " << ticks << " ticks x " << nodes
            << " nodes needs " << mb << " MB, limit is " << max_memory_mb << " MB";
        throw ResourceError(msg.str());
    }
    ticks_ = ticks;
    nodes_ = nodes;
    filled_ = 0;
    start_ = start;
    sampling_rate_ = sampling_rate;
    data_.assign(ticks * nodes, 0.0);
}

std::vector<double> CoalescenceVolume::marginalise(MarginalMode mode) const {
    std::vector<double> out(nodes_, 0.0);
    for (size_t t = 0; t < filled_; t++) {
        const double* row = tick(t);
        if (mode == MarginalMode::Sum) {
            for (size_t n = 0; n < nodes_; n++) out[n] += row[n];
        } else {
            for (size_t n = 0; n < nodes_; n++) out[n] = std::max(out[n], row[n]);
        }
    }
    return out;
}

std::vector<double> CoalescenceVolume::nodeSeries(size_t node) const {
    std::vector<double> out(filled_);
    for (size_t t = 0; t < filled_; t++) out[t] = at(t, node);
    return out;
}

} // namespace quakemigrate
