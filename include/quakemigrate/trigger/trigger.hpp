#pragma once

#include "quakemigrate/core/types.hpp"
#include "quakemigrate/core/settings.hpp"
#include "quakemigrate/migration/coalescence.hpp"
#include <string>
#include <vector>

namespace quakemigrate {

/**
 * Trigger - Candidate event cut from the continuous coalescence
 */
struct Trigger {
    int event_num;
    std::string uid;
    TimePoint peak_time;
    double peak_value;          // coalescence, never normalised
    double peak_normalised;
    size_t node;                // on the scan grid
    Point3 position;
    TimePoint start_time;       // first tick above threshold
    TimePoint end_time;         // last tick above threshold
    double threshold;           // threshold at the peak

    Trigger() : event_num(0), peak_value(0), peak_normalised(0), node(0), threshold(0) {}
};

/**
 * TriggerEngine - Turns a coalescence series into candidate events
 *
 * Ticks whose thresholded quantity exceeds the threshold form exceedance
 * intervals; the peak of each interval is a candidate. A candidate whose
 * peak lies within min_event_interval of the previous one is merged into
 * it, keeping the larger peak. An interval still open at the end of the
 * series is closed at its last tick.
 */
class TriggerEngine {
public:
    explicit TriggerEngine(const TriggerSettings& settings);

    std::vector<Trigger> run(const CoalescenceSeries& series) const;

    // Candidates whose peak lies in [start, end)
    std::vector<Trigger> run(const CoalescenceSeries& series,
                             TimePoint start, TimePoint end) const;

    // Threshold applied at every sample of the series
    std::vector<double> thresholds(const CoalescenceSeries& series) const;

    const TriggerSettings& settings() const { return settings_; }

private:
    TriggerSettings settings_;

    double quantity(const CoalescenceSample& s) const {
        return settings_.normalise_coalescence ? s.normalised : s.value;
    }
};

} // namespace quakemigrate
