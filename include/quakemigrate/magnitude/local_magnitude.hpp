#pragma once

#include "quakemigrate/core/event.hpp"
#include "quakemigrate/core/settings.hpp"
#include "quakemigrate/core/waveform.hpp"
#include "quakemigrate/lut/lookup_table.hpp"
#include "quakemigrate/onset/filter.hpp"
#include <map>
#include <regex>
#include <string>

namespace quakemigrate {

/**
 * LocalMagnitude - ML from the largest half peak-to-peak amplitude in the
 * P-to-S signal window of each channel
 *
 *   ML = log10(A * amp_multiplier) - log10 A0(r) + station correction
 *
 * with -log10 A0(r) one of the published attenuation curves:
 *   Hutton-Boore  1.11 log10(r/100) + 0.00189 (r - 100) + 3.0
 *   keir2006      1.196997 log10(r/17) + 0.001066 (r - 17) + 2.0
 *   UK            1.11 log10(r) + 0.00189 r - 1.16 exp(-0.2 r) - 2.09
 *   Richter       2.76 log10(r) - 2.48
 *
 * r is epicentral distance, or hypocentral with use_hyp_dist, from the
 * location estimate named by loc_method. amp_feature selects the P window
 * (P arrival to the start of the S window) or the S window. The network
 * value is the (optionally amplitude/noise weighted) mean over stations
 * passing the noise, distance, pick, trace and station filters.
 */
class LocalMagnitude {
public:
    // Throws ConfigError for an unknown attenuation curve or a bad trace filter
    LocalMagnitude(const MagnitudeSettings& settings, double marginal_window, double fraction_tt);

    LocalMagnitudeResult calculate(const Event& event,
                                   const WaveformMap& waveforms,
                                   const LookupTable& lut) const;

    // -log10 A0 at distance r (km); throws ConfigError for an unknown name
    static double attenuation(const std::string& name, double distance);

    // Largest half peak-to-peak amplitude between successive extrema of
    // data[first, last]; period is twice the time between them (0 if the
    // window holds a single swing)
    static void halfPeakToPeak(const SampleVector& data, double sample_rate,
                               size_t first, size_t last,
                               double& amplitude, double& period);

    // Estimate named by loc_method, the peak node when it is not valid
    static Point3 hypocentre(const Event& event, const LookupTable& lut,
                             const std::string& loc_method);

    void setStationCorrection(const std::string& station, double correction) {
        settings_.station_corrections[station] = correction;
    }

private:
    MagnitudeSettings settings_;
    double marginal_window_;
    double fraction_tt_;
    std::regex trace_filter_;

    // Filtered copy of a channel, or the demeaned input when no filter is set
    SampleVector prepare(const Waveform& waveform) const;

    double correctionFor(const StreamID& id) const;
    bool excluded(const StreamID& id) const;
};

} // namespace quakemigrate
