#pragma once

#include "onset.hpp"
#include "filter.hpp"
#include "quakemigrate/core/settings.hpp"

namespace quakemigrate {

/**
 * STALTAOnset - Energy STA/LTA onset function
 *
 * Each selected channel is pre-processed, squared and run through an STA/LTA
 * ratio; the onset is max(ratio - 1, 0), or max(ln(ratio), 0) in log mode.
 *
 * Classic policy: trailing windows ending at the sample and a causal filter.
 * The mean removed beforehand is that of the first LTA window, so a usable
 * value never depends on later samples.
 *
 * Centred policy: windows centred on the sample, full demean/detrend/taper
 * and zero-phase filtering. Used for location and picking.
 */
class STALTAOnset : public OnsetFunction {
public:
    STALTAOnset(const OnsetSettings& settings, OnsetPolicy policy);

    OnsetData compute(const WaveformMap& waveforms, const LookupTable& lut) const override;

    double prePadding() const override;
    double postPadding() const override;
    std::string name() const override;

    OnsetPolicy policy() const { return policy_; }
    const OnsetSettings& settings() const { return settings_; }

    // Onset of one channel. Throws ConfigError if a filter corner is not
    // below the Nyquist frequency.
    OnsetTrace channelOnset(const Waveform& waveform, const PhaseOnsetSettings& phase) const;

    // STA/LTA onset of a signal. missing[i] != 0 marks gap samples.
    static void staLta(const SampleVector& signal,
                       const std::vector<char>& missing,
                       size_t nsta, size_t nlta,
                       OnsetPolicy policy, bool log,
                       SampleVector& values,
                       std::vector<char>& available);

private:
    OnsetSettings settings_;
    OnsetPolicy policy_;

    static void windowLengths(const PhaseOnsetSettings& phase, double sample_rate,
                              size_t& nsta, size_t& nlta);
};

} // namespace quakemigrate
