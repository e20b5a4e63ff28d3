#pragma once

#include "quakemigrate/core/types.hpp"
#include "quakemigrate/core/waveform.hpp"
#include "quakemigrate/lut/lookup_table.hpp"
#include <string>
#include <vector>

namespace quakemigrate {

/**
 * OnsetTrace - Onset function of one station and phase
 *
 * Values are non-negative; a sample whose window was incomplete or touched
 * missing data has value 0 and available[i] == 0.
 */
struct OnsetTrace {
    std::string station;        // "NET.STA"
    PhaseType phase;
    TimePoint start_time;
    double sample_rate;
    SampleVector values;
    std::vector<char> available;

    OnsetTrace() : phase(PhaseType::Unknown), sample_rate(0) {}

    bool empty() const { return values.empty(); }
    size_t size() const { return values.size(); }

    TimePoint timeAt(size_t idx) const { return addSeconds(start_time, idx / sample_rate); }
    TimePoint endTime() const { return empty() ? start_time : timeAt(values.size() - 1); }

    size_t availableCount() const {
        size_t n = 0;
        for (char a : available) n += a ? 1 : 0;
        return n;
    }

    // Linear interpolation at t; false outside the trace or when either
    // neighbouring sample is unavailable
    bool valueAt(TimePoint t, double& value) const;
};

/**
 * OnsetData - Onset traces of one processing window, in lookup-table
 * (station, phase) order. Missing pairs hold an empty trace.
 */
class OnsetData {
public:
    OnsetData() : stations_(0), phases_(0) {}
    OnsetData(size_t stations, size_t phases)
        : stations_(stations), phases_(phases), traces_(stations * phases) {}

    size_t stationCount() const { return stations_; }
    size_t phaseCount() const { return phases_; }
    size_t pairCount() const { return traces_.size(); }

    const OnsetTrace& trace(size_t station, size_t phase) const {
        return traces_[station * phases_ + phase];
    }
    OnsetTrace& trace(size_t station, size_t phase) {
        return traces_[station * phases_ + phase];
    }

    const std::vector<OnsetTrace>& traces() const { return traces_; }

    // Pairs with any data
    size_t presentCount() const {
        size_t n = 0;
        for (const auto& t : traces_) n += t.empty() ? 0 : 1;
        return n;
    }

private:
    size_t stations_;
    size_t phases_;
    std::vector<OnsetTrace> traces_;
};

/**
 * OnsetFunction - Turns raw waveforms into onset traces for a lookup table
 */
class OnsetFunction {
public:
    virtual ~OnsetFunction() = default;

    virtual OnsetData compute(const WaveformMap& waveforms, const LookupTable& lut) const = 0;

    // Seconds of data needed before the first and after the last sample
    // that should carry a usable onset value
    virtual double prePadding() const = 0;
    virtual double postPadding() const = 0;

    virtual std::string name() const = 0;
};

} // namespace quakemigrate
