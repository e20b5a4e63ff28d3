#pragma once

#include "quakemigrate/core/types.hpp"
#include <vector>

namespace quakemigrate {

/**
 * IIRFilter - Butterworth filter as a cascade of second-order sections
 *
 * Each section is a bilinear-transformed analog biquad, run in Direct Form
 * II transposed. Odd orders add one first-order section.
 */
class IIRFilter {
public:
    // Normalised coefficients of one section (a0 == 1)
    struct Section {
        double b0, b1, b2;
        double a1, a2;
    };

    IIRFilter() = default;

    // Create Butterworth bandpass filter (highpass at low_freq followed by
    // lowpass at high_freq, each of the given order)
    static IIRFilter butterworth(int order, double low_freq, double high_freq,
                                 double sample_rate);

    // Create Butterworth lowpass filter
    static IIRFilter butterworthLowpass(int order, double cutoff,
                                        double sample_rate);

    // Create Butterworth highpass filter
    static IIRFilter butterworthHighpass(int order, double cutoff,
                                         double sample_rate);

    // Apply filter to data (in-place)
    void apply(SampleVector& data) const;

    // Causal filtering (copy)
    SampleVector filter(const SampleVector& data) const;

    // Zero-phase filtering (forward-backward)
    SampleVector filtfilt(const SampleVector& data) const;

    bool empty() const { return sections_.empty(); }
    const std::vector<Section>& sections() const { return sections_; }

private:
    std::vector<Section> sections_;

    static void addLowpass(IIRFilter& f, int order, double cutoff, double sample_rate);
    static void addHighpass(IIRFilter& f, int order, double cutoff, double sample_rate);
};

} // namespace quakemigrate
