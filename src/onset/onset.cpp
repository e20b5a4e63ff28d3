#include "quakemigrate/onset/onset.hpp"
#include <cmath>

namespace quakemigrate {

bool OnsetTrace::valueAt(TimePoint t, double& value) const {
    if (values.empty()) return false;
    double pos = secondsBetween(start_time, t) * sample_rate;
    if (pos < 0 || pos > static_cast<double>(values.size() - 1)) return false;

    size_t i0 = static_cast<size_t>(pos);
    double frac = pos - i0;
    if (!available[i0]) return false;
    if (frac == 0 || i0 + 1 >= values.size()) {
        value = values[i0];
        return true;
    }
    if (!available[i0 + 1]) return false;
    value = values[i0] + frac * (values[i0 + 1] - values[i0]);
    return true;
}

} // namespace quakemigrate
