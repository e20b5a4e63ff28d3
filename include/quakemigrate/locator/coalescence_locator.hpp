#pragma once

#include "marginal_volume.hpp"
#include "quakemigrate/core/event.hpp"
#include "quakemigrate/core/projection.hpp"
#include "quakemigrate/core/settings.hpp"
#include "quakemigrate/migration/migration_engine.hpp"
#include "quakemigrate/onset/stalta_onset.hpp"
#include "quakemigrate/trigger/trigger.hpp"
#include <memory>

namespace quakemigrate {

/**
 * LocateResult - Everything the locate run of one trigger produced
 */
struct LocateResult {
    Event event;
    OnsetData onsets;               // centred onsets, reused by the picker
    CoalescenceSeries series;       // coalescence of the locate run
    CoalescenceVolume volume;       // retained stack of every node
    std::vector<double> marginal;   // volume collapsed over time
};

/**
 * CoalescenceLocator - Re-migrates the marginal window around a trigger at
 * full grid resolution and derives the hypocentre and its uncertainty
 */
class CoalescenceLocator {
public:
    CoalescenceLocator(LookupTablePtr lut, const RunSettings& settings);

    // Optional; fills the event's geographic position
    void setProjection(ProjectionPtr projection) { projection_ = std::move(projection); }

    // Ticks migrated: [peak - window/2, peak + window/2]
    TimePoint windowStart(const Trigger& trigger) const;
    TimePoint windowEnd(const Trigger& trigger) const;

    // Waveform span needed to compute onsets for the window
    TimePoint dataStart(const Trigger& trigger) const;
    TimePoint dataEnd(const Trigger& trigger) const;

    // Waveforms must cover [dataStart, dataEnd]; throws ResourceError if the
    // retained volume exceeds locate.max_volume_mb
    LocateResult locate(const Trigger& trigger, const WaveformMap& waveforms) const;

    const STALTAOnset& onsetFunction() const { return onset_; }

private:
    LookupTablePtr lut_;
    RunSettings settings_;
    STALTAOnset onset_;
    ProjectionPtr projection_;
};

} // namespace quakemigrate
