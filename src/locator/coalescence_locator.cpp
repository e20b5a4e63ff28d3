#include "quakemigrate/locator/coalescence_locator.hpp"
#include "quakemigrate/core/time_util.hpp"
#include <iostream>

namespace quakemigrate {

CoalescenceLocator::CoalescenceLocator(LookupTablePtr lut, const RunSettings& settings)
    : lut_(std::move(lut))
    , settings_(settings)
    , onset_(settings.onset, OnsetPolicy::Centred)
{
}

TimePoint CoalescenceLocator::windowStart(const Trigger& trigger) const {
    return addSeconds(trigger.peak_time, -settings_.locate.marginal_window / 2.0);
}

TimePoint CoalescenceLocator::windowEnd(const Trigger& trigger) const {
    return addSeconds(trigger.peak_time, settings_.locate.marginal_window / 2.0);
}

TimePoint CoalescenceLocator::dataStart(const Trigger& trigger) const {
    // Room for the picker's noise window ahead of early arrivals
    double picker_pad = settings_.picker.noise_window + settings_.picker.half_width;
    return addSeconds(windowStart(trigger), -onset_.prePadding() - picker_pad - 1.0);
}

TimePoint CoalescenceLocator::dataEnd(const Trigger& trigger) const {
    return addSeconds(windowEnd(trigger),
                      lut_->maxTraveltime() + onset_.postPadding() + 1.0);
}

LocateResult CoalescenceLocator::locate(const Trigger& trigger,
                                        const WaveformMap& waveforms) const {
    LocateResult result;
    Event& event = result.event;
    event.uid = trigger.uid;
    event.trigger_num = trigger.event_num;
    event.trigger_time = trigger.peak_time;
    event.trigger_value = trigger.peak_value;

    result.onsets = onset_.compute(waveforms, *lut_);

    MigrationOptions options;
    options.sampling_rate = settings_.locate.sampling_rate;
    options.stack = settings_.scan.stack;
    options.normalise = settings_.scan.normalise;
    options.threads = static_cast<size_t>(settings_.scan.threads);
    options.block_size = settings_.scan.block_size;
    options.max_volume_mb = settings_.locate.max_volume_mb;

    // Half a tick past the end keeps the last tick of the window
    double dt = 1.0 / options.sampling_rate;
    MigrationEngine engine(lut_, options);
    engine.run(result.onsets, windowStart(trigger), addSeconds(windowEnd(trigger), dt / 2.0),
               result.series, &result.volume);

    const Grid3D& grid = lut_->grid();
    if (result.series.empty()) {
        std::cerr << "Locator: event " << event.uid << " has an empty locate window" << std::endl;
        event.quality_flags |= QUALITY_NO_CONTRIBUTORS | QUALITY_FLAT_VOLUME;
        event.origin_time = trigger.peak_time;
        event.refined_origin_time = trigger.peak_time;
        return result;
    }

    size_t best = 0;
    for (size_t i = 1; i < result.series.size(); i++) {
        if (result.series[i].value > result.series[best].value) best = i;
    }
    const CoalescenceSample& peak = result.series[best];
    event.origin_time = peak.time;
    event.coa_value = peak.value;
    event.coa_normalised = peak.normalised;
    event.contributors = static_cast<int>(peak.contributors);
    if (peak.contributors == 0) {
        event.quality_flags |= QUALITY_NO_CONTRIBUTORS;
    }

    result.marginal = result.volume.marginalise(settings_.locate.marginal);
    MarginalVolume marginal(grid, result.marginal);
    event.peak_node = marginal.peakNode();

    event.spline = marginal.quadraticEstimate(settings_.locate.uncertainty_fraction,
                                              settings_.locate.flat_tolerance,
                                              event.quality_flags);
    if (!(event.quality_flags & QUALITY_FLAT_VOLUME)) {
        event.gaussian = marginal.gaussianEstimate(settings_.locate.gaussian_half_width,
                                                   event.quality_flags);
        event.covariance = marginal.covarianceEstimate(settings_.locate.covariance_fraction,
                                                       event.quality_flags);
    }

    std::vector<double> at_node = result.volume.nodeSeries(event.peak_node);
    size_t refined = 0;
    for (size_t t = 1; t < at_node.size(); t++) {
        if (at_node[t] > at_node[refined]) refined = t;
    }
    event.refined_origin_time = result.volume.timeAt(refined);

    if (projection_) {
        event.geographic = projection_->inverse(event.spline.position);
        event.has_geographic = true;
    }

    if (event.quality_flags != QUALITY_OK) {
        std::cerr << "Locator: event " << event.uid << " quality: "
                  << qualityFlagsToString(event.quality_flags) << std::endl;
    }
    return result;
}

} // namespace quakemigrate
