#include "quakemigrate/core/event.hpp"
#include "quakemigrate/core/time_util.hpp"
#include <sstream>
#include <iomanip>

namespace quakemigrate {

std::string pickStatusToString(PickStatus status) {
    switch (status) {
        case PickStatus::Ok: return "ok";
        case PickStatus::NoData: return "no_data";
        case PickStatus::NoPeak: return "no_peak";
        case PickStatus::NotConverged: return "not_converged";
        case PickStatus::NegativeWidth: return "negative_width";
        case PickStatus::OutsideWindow: return "outside_window";
    }
    return "?";
}

std::string qualityFlagsToString(uint32_t flags) {
    if (flags == QUALITY_OK) return "ok";

    static const std::pair<uint32_t, const char*> names[] = {
        {QUALITY_FLAT_VOLUME, "flat_volume"},
        {QUALITY_BOUNDARY_X, "boundary_x"},
        {QUALITY_BOUNDARY_Y, "boundary_y"},
        {QUALITY_BOUNDARY_Z, "boundary_z"},
        {QUALITY_GAUSSIAN_FAILED, "gaussian_failed"},
        {QUALITY_COVARIANCE_FAILED, "covariance_failed"},
        {QUALITY_NO_CONTRIBUTORS, "no_contributors"},
    };

    std::string out;
    for (const auto& [bit, name] : names) {
        if (flags & bit) {
            if (!out.empty()) out += "|";
            out += name;
        }
    }
    return out;
}

int Event::validPickCount() const {
    int n = 0;
    for (const auto& p : picks) {
        if (p.valid) n++;
    }
    return n;
}

std::string Event::summary() const {
    std::ostringstream oss;

    oss << std::fixed << std::setprecision(3);
    oss << "Event: " << uid << "\n";
    oss << "  Origin time: " << formatTime(origin_time) << " UTC\n";
    oss << "  Location: X=" << spline.position.x << " Y=" << spline.position.y
        << " Z=" << spline.position.z << " km"
        << " (+/- " << spline.uncertainty.x << ", " << spline.uncertainty.y
        << ", " << spline.uncertainty.z << ")\n";
    if (has_geographic) {
        oss << "  Geographic: " << std::setprecision(5) << geographic.latitude << " N, "
            << geographic.longitude << " E, " << std::setprecision(3)
            << geographic.depth << " km\n";
    }
    oss << "  Coalescence: " << coa_value << " (normalised " << coa_normalised
        << ", " << contributors << " contributing)\n";
    oss << "  Picks: " << validPickCount() << "/" << picks.size() << " valid\n";
    if (magnitude && magnitude->valid()) {
        oss << "  ML: " << magnitude->value << " +/- " << magnitude->uncertainty
            << " (" << magnitude->station_count << " observations)\n";
    }
    oss << "  Quality: " << qualityFlagsToString(quality_flags) << "\n";

    return oss.str();
}

} // namespace quakemigrate
