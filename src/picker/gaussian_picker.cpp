#include "quakemigrate/picker/gaussian_picker.hpp"
#include <Eigen/Dense>
#include <algorithm>
#include <cmath>

namespace quakemigrate {

GaussianPicker::GaussianPicker(const PickerSettings& settings, double fraction_tt)
    : settings_(settings)
    , fraction_tt_(fraction_tt)
{
}

void GaussianPicker::setParameter(const std::string& name, double value) {
    if (name == "half_width") settings_.half_width = value;
    else if (name == "noise_window") settings_.noise_window = value;
    else if (name == "threshold_multiplier") settings_.threshold_multiplier = value;
    else if (name == "uncertainty_scale") settings_.uncertainty_scale = value;
    else if (name == "max_iterations") settings_.max_iterations = static_cast<int>(value);
    else if (name == "fraction_tt") fraction_tt_ = value;
}

double GaussianPicker::getParameter(const std::string& name) const {
    if (name == "half_width") return settings_.half_width;
    if (name == "noise_window") return settings_.noise_window;
    if (name == "threshold_multiplier") return settings_.threshold_multiplier;
    if (name == "uncertainty_scale") return settings_.uncertainty_scale;
    if (name == "max_iterations") return settings_.max_iterations;
    if (name == "fraction_tt") return fraction_tt_;
    return 0;
}

GaussianPicker::GaussianFit GaussianPicker::fitGaussian(const std::vector<double>& t,
                                                        const std::vector<double>& y,
                                                        double amplitude, double mean,
                                                        double sigma, int max_iterations) {
    const int n = static_cast<int>(t.size());
    Eigen::Vector3d p(amplitude, mean, sigma);

    auto cost = [&](const Eigen::Vector3d& q) {
        double c = 0;
        for (int i = 0; i < n; i++) {
            double d = t[i] - q(1);
            double r = y[i] - q(0) * std::exp(-d * d / (2.0 * q(2) * q(2)));
            c += r * r;
        }
        return c;
    };

    GaussianFit result;
    double lambda = 1e-3;
    double current = cost(p);

    for (int iter = 0; iter < max_iterations; iter++) {
        result.iterations = iter + 1;

        Eigen::MatrixXd J(n, 3);
        Eigen::VectorXd r(n);
        for (int i = 0; i < n; i++) {
            double d = t[i] - p(1);
            double s2 = p(2) * p(2);
            double e = std::exp(-d * d / (2.0 * s2));
            J(i, 0) = e;
            J(i, 1) = p(0) * e * d / s2;
            J(i, 2) = p(0) * e * d * d / (s2 * p(2));
            r(i) = y[i] - p(0) * e;
        }

        // Levenberg-Marquardt step: (J'J + lambda * diag(J'J)) dp = J'r
        Eigen::Matrix3d JtJ = J.transpose() * J;
        Eigen::Vector3d Jtr = J.transpose() * r;
        Eigen::Matrix3d A = JtJ;
        for (int k = 0; k < 3; k++) A(k, k) += lambda * std::max(JtJ(k, k), 1e-12);
        Eigen::Vector3d dp = A.ldlt().solve(Jtr);
        if (!dp.allFinite()) break;

        Eigen::Vector3d trial = p + dp;
        double trial_cost = trial(2) != 0 ? cost(trial) : current + 1;

        if (trial_cost < current) {
            double improvement = current - trial_cost;
            p = trial;
            current = trial_cost;
            lambda = std::max(lambda / 10.0, 1e-12);
            if (dp.norm() < 1e-9 * (p.norm() + 1e-9) || improvement < 1e-12 * (current + 1e-12)) {
                result.converged = true;
                break;
            }
        } else {
            lambda *= 10.0;
            if (lambda > 1e12) {
                // No downhill step left: already at the minimum
                result.converged = true;
                break;
            }
        }
    }

    result.amplitude = p(0);
    result.mean = p(1);
    result.sigma = p(2);
    return result;
}

Pick GaussianPicker::fit(const OnsetTrace& onset, TimePoint predicted, double traveltime) const {
    Pick pick;
    pick.station = onset.station;
    pick.phase = onset.phase;
    pick.modelled_time = predicted;
    pick.time = predicted;
    pick.traveltime = traveltime;
    pick.valid = false;
    pick.status = PickStatus::NoData;

    if (onset.empty() || !(onset.sample_rate > 0)) return pick;

    const double rate = onset.sample_rate;
    const double half_width = settings_.half_width + fraction_tt_ * traveltime;
    const double centre = secondsBetween(onset.start_time, predicted);
    const double win_start = centre - half_width;
    const double win_end = centre + half_width;
    const long last = static_cast<long>(onset.size()) - 1;

    auto firstIndex = [&](double seconds) {
        return std::max(0L, static_cast<long>(std::ceil(seconds * rate - 1e-9)));
    };
    auto lastIndex = [&](double seconds) {
        return std::min(last, static_cast<long>(std::floor(seconds * rate + 1e-9)));
    };

    // Window samples, time relative to the window start
    std::vector<double> t, y;
    for (long i = firstIndex(win_start); i <= lastIndex(win_end); i++) {
        if (!onset.available[i]) continue;
        t.push_back(i / rate - win_start);
        y.push_back(onset.values[i]);
    }

    std::vector<double> noise;
    const long noise_end = std::min(firstIndex(win_start), last + 1);
    for (long i = firstIndex(win_start - settings_.noise_window); i < noise_end; i++) {
        if (onset.available[i]) noise.push_back(onset.values[i]);
    }

    if (t.size() < 4 || noise.size() < 2) return pick;

    double mean = 0, sq = 0;
    for (double v : noise) {
        mean += v;
        sq += v * v;
    }
    mean /= noise.size();
    double rms = std::sqrt(sq / noise.size());
    double var = 0;
    for (double v : noise) var += (v - mean) * (v - mean);
    double std_dev = std::sqrt(var / noise.size());

    size_t imax = 0;
    for (size_t i = 0; i < y.size(); i++) {
        y[i] -= mean;
        if (y[i] > y[imax]) imax = i;
    }
    double peak = y[imax];
    if (!(peak > 0) || peak <= settings_.threshold_multiplier * std_dev) {
        pick.status = PickStatus::NoPeak;
        return pick;
    }

    // Width guess from the half-maximum crossings around the peak
    size_t lo = imax, hi = imax;
    while (lo > 0 && y[lo - 1] > peak / 2) lo--;
    while (hi + 1 < y.size() && y[hi + 1] > peak / 2) hi++;
    double sigma0 = std::max((t[hi] - t[lo] + 1.0 / rate) / 2.3548, 1.0 / rate);

    GaussianFit g = fitGaussian(t, y, peak, t[imax], sigma0, settings_.max_iterations);

    pick.amplitude = g.amplitude;
    pick.sigma = g.sigma;
    if (!g.converged || !std::isfinite(g.mean) || !std::isfinite(g.sigma)) {
        pick.status = PickStatus::NotConverged;
        return pick;
    }
    if (!(g.sigma > 0) || !(g.amplitude > 0)) {
        pick.status = PickStatus::NegativeWidth;
        return pick;
    }
    if (g.mean < 0 || g.mean > win_end - win_start) {
        pick.status = PickStatus::OutsideWindow;
        return pick;
    }

    pick.time = addSeconds(onset.start_time, win_start + g.mean);
    pick.uncertainty = g.sigma * settings_.uncertainty_scale;
    pick.snr = g.amplitude / std::max(rms, 1e-6);
    pick.valid = true;
    pick.status = PickStatus::Ok;
    return pick;
}

} // namespace quakemigrate
