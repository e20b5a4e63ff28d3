#pragma once

#include "picker.hpp"
#include "quakemigrate/core/settings.hpp"
#include <vector>

namespace quakemigrate {

/**
 * GaussianPicker - Fits A * exp(-(t - mu)^2 / (2 sigma^2)) to the onset
 * around the modelled arrival
 *
 * The pick window is the modelled time +/- (half_width + fraction_tt * tt).
 * The noise_window seconds before it give the baseline (mean) and noise
 * level (RMS, std). Without a peak above threshold_multiplier * std the
 * pick is invalid with status no_peak; otherwise a Levenberg-Marquardt fit
 * gives pick time mu, uncertainty sigma * uncertainty_scale and SNR
 * A / noise RMS.
 */
class GaussianPicker : public PhasePicker {
public:
    GaussianPicker(const PickerSettings& settings, double fraction_tt);

    Pick fit(const OnsetTrace& onset, TimePoint predicted, double traveltime) const override;
    std::string name() const override { return "Gaussian"; }

    void setParameter(const std::string& name, double value) override;
    double getParameter(const std::string& name) const override;

    struct GaussianFit {
        double amplitude;
        double mean;
        double sigma;
        int iterations;
        bool converged;

        GaussianFit() : amplitude(0), mean(0), sigma(0), iterations(0), converged(false) {}
    };

    // Least-squares Gaussian through (t, y) from a starting guess
    static GaussianFit fitGaussian(const std::vector<double>& t,
                                   const std::vector<double>& y,
                                   double amplitude, double mean, double sigma,
                                   int max_iterations);

private:
    PickerSettings settings_;
    double fraction_tt_;
};

} // namespace quakemigrate
