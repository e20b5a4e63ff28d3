#pragma once

#include "types.hpp"
#include <vector>
#include <memory>
#include <optional>

namespace quakemigrate {

/**
 * PickStatus - Outcome of fitting one station/phase onset
 */
enum class PickStatus {
    Ok,
    NoData,         // no onset samples in the pick window
    NoPeak,         // nothing above the noise threshold
    NotConverged,   // fit did not converge
    NegativeWidth,  // fitted width or amplitude not positive
    OutsideWindow   // fitted centre outside the pick window
};

std::string pickStatusToString(PickStatus status);

/**
 * Pick - A phase arrival pick fitted to an onset function
 */
struct Pick {
    std::string station;        // "NET.STA"
    PhaseType phase;
    TimePoint modelled_time;    // origin + travel time
    TimePoint time;             // fitted arrival, equal to modelled_time if invalid
    double traveltime;          // s
    double uncertainty;         // s
    double snr;
    double amplitude;           // fitted Gaussian height above the noise baseline
    double sigma;               // fitted Gaussian width (s)
    bool valid;
    PickStatus status;

    Pick() : phase(PhaseType::Unknown), traveltime(0), uncertainty(0), snr(0),
             amplitude(0), sigma(0), valid(false), status(PickStatus::NoData) {}
};

/**
 * LocationEstimate - Hypocentre estimate with 1-sigma uncertainty per axis
 */
struct LocationEstimate {
    Point3 position;
    Point3 uncertainty;
    bool valid;

    LocationEstimate() : valid(false) {}
};

// Location quality flags (bit mask)
enum QualityFlag : uint32_t {
    QUALITY_OK = 0,
    QUALITY_FLAT_VOLUME = 1u << 0,
    QUALITY_BOUNDARY_X = 1u << 1,
    QUALITY_BOUNDARY_Y = 1u << 2,
    QUALITY_BOUNDARY_Z = 1u << 3,
    QUALITY_GAUSSIAN_FAILED = 1u << 4,
    QUALITY_COVARIANCE_FAILED = 1u << 5,
    QUALITY_NO_CONTRIBUTORS = 1u << 6
};

// "ok" or a '|'-separated list of flag names
std::string qualityFlagsToString(uint32_t flags);

/**
 * StationMagnitude - Amplitude observation and its local magnitude
 */
struct StationMagnitude {
    StreamID stream_id;
    double epicentral_distance;     // km
    double hypocentral_distance;    // km
    double amplitude;               // half peak-to-peak
    double period;                  // s
    double noise_amplitude;
    double magnitude;
    double correction;
    bool picked;
    bool used;

    StationMagnitude() : epicentral_distance(0), hypocentral_distance(0),
                         amplitude(0), period(0), noise_amplitude(0),
                         magnitude(0), correction(0), picked(false), used(false) {}
};

/**
 * LocalMagnitudeResult - Network-averaged local magnitude
 */
struct LocalMagnitudeResult {
    double value;
    double uncertainty;
    int station_count;
    std::vector<StationMagnitude> station_magnitudes;

    LocalMagnitudeResult() : value(0), uncertainty(0), station_count(0) {}
    bool valid() const { return station_count > 0; }
};

/**
 * Event - Located event with picks and optional magnitude
 */
struct Event {
    std::string uid;
    int trigger_num;
    TimePoint trigger_time;
    double trigger_value;

    TimePoint origin_time;          // coalescence peak of the locate run
    TimePoint refined_origin_time;  // coalescence peak at the best-fit node
    double coa_value;
    double coa_normalised;
    int contributors;
    size_t peak_node;

    LocationEstimate spline;        // quadratic sub-node refinement
    LocationEstimate gaussian;
    LocationEstimate covariance;
    GeoPoint geographic;
    bool has_geographic;

    uint32_t quality_flags;
    std::vector<Pick> picks;
    std::optional<LocalMagnitudeResult> magnitude;

    Event() : trigger_num(0), trigger_value(0), coa_value(0), coa_normalised(0),
              contributors(0), peak_node(0), has_geographic(false),
              quality_flags(QUALITY_OK) {}

    int validPickCount() const;

    // Summary
    std::string summary() const;
};

using EventPtr = std::shared_ptr<Event>;

} // namespace quakemigrate
