#include "quakemigrate/magnitude/local_magnitude.hpp"
#include "quakemigrate/core/exception.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <numeric>

namespace quakemigrate {

LocalMagnitude::LocalMagnitude(const MagnitudeSettings& settings, double marginal_window,
                               double fraction_tt)
    : settings_(settings)
    , marginal_window_(marginal_window)
    , fraction_tt_(fraction_tt)
{
    attenuation(settings_.a0, 100.0);
    try {
        trace_filter_ = std::regex(settings_.trace_filter);
    } catch (const std::regex_error& e) {
        throw ConfigError("magnitude: invalid trace filter '" + settings_.trace_filter +
                          "': " + e.what());
    }
}

double LocalMagnitude::attenuation(const std::string& name, double distance) {
    double r = std::max(distance, 1e-3);
    if (name == "Hutton-Boore") {
        return 1.11 * std::log10(r / 100.0) + 0.00189 * (r - 100.0) + 3.0;
    }
    if (name == "keir2006") {
        return 1.196997 * std::log10(r / 17.0) + 0.001066 * (r - 17.0) + 2.0;
    }
    if (name == "UK") {
        return 1.11 * std::log10(r) + 0.00189 * r - 1.16 * std::exp(-0.2 * r) - 2.09;
    }
    if (name == "Richter") {
        return 2.76 * std::log10(r) - 2.48;
    }
    throw ConfigError("magnitude: unknown attenuation curve '" + name + "'");
}

void LocalMagnitude::halfPeakToPeak(const SampleVector& data, double sample_rate,
                                    size_t first, size_t last,
                                    double& amplitude, double& period) {
    amplitude = 0;
    period = 0;
    if (data.empty() || first > last) return;
    last = std::min(last, data.size() - 1);

    // Turning points, window ends included
    std::vector<size_t> extrema;
    extrema.push_back(first);
    for (size_t i = first + 1; i < last; i++) {
        double prev = data[i] - data[i - 1];
        double next = data[i + 1] - data[i];
        if ((prev > 0 && next <= 0) || (prev < 0 && next >= 0)) extrema.push_back(i);
    }
    if (last > first) extrema.push_back(last);

    if (extrema.size() < 2) return;
    for (size_t e = 0; e + 1 < extrema.size(); e++) {
        double half = 0.5 * std::abs(data[extrema[e + 1]] - data[extrema[e]]);
        if (half > amplitude) {
            amplitude = half;
            period = 2.0 * (extrema[e + 1] - extrema[e]) / sample_rate;
        }
    }
}

SampleVector LocalMagnitude::prepare(const Waveform& waveform) const {
    Waveform work = waveform;
    work.demean();
    work.detrend();
    work.fillGaps(0.0);
    SampleVector& data = work.data();

    if (settings_.filter == "bandpass") {
        auto f = IIRFilter::butterworth(settings_.filter_corners, settings_.filter_low,
                                        settings_.filter_high, waveform.sampleRate());
        return f.filtfilt(data);
    }
    if (settings_.filter == "highpass") {
        auto f = IIRFilter::butterworthHighpass(settings_.filter_corners, settings_.filter_low,
                                                waveform.sampleRate());
        return f.filtfilt(data);
    }
    return data;
}

double LocalMagnitude::correctionFor(const StreamID& id) const {
    auto it = settings_.station_corrections.find(id.toString());
    if (it != settings_.station_corrections.end()) return it->second;
    it = settings_.station_corrections.find(id.stationKey());
    if (it != settings_.station_corrections.end()) return it->second;
    return 0.0;
}

bool LocalMagnitude::excluded(const StreamID& id) const {
    for (const auto& code : settings_.station_filter) {
        if (code == id.station || code == id.stationKey()) return true;
    }
    return !settings_.trace_filter.empty() && !std::regex_search(id.toString(), trace_filter_);
}

Point3 LocalMagnitude::hypocentre(const Event& event, const LookupTable& lut,
                                  const std::string& loc_method) {
    const LocationEstimate* estimate = &event.spline;
    if (loc_method == "gaussian") estimate = &event.gaussian;
    else if (loc_method == "covariance") estimate = &event.covariance;
    if (estimate->valid) return estimate->position;
    return lut.grid().nodePosition(event.peak_node);
}

LocalMagnitudeResult LocalMagnitude::calculate(const Event& event,
                                               const WaveformMap& waveforms,
                                               const LookupTable& lut) const {
    LocalMagnitudeResult result;
    const Point3 source = hypocentre(event, lut, settings_.loc_method);
    const bool p_amp = settings_.amp_feature == "P_amp";
    const int p_idx = lut.phaseIndex(PhaseType::P);
    const int s_idx = lut.phaseIndex(PhaseType::S);
    if (p_idx < 0 && s_idx < 0) return result;

    std::vector<double> magnitudes;
    std::vector<double> weights;

    for (const auto& [id, wf] : waveforms) {
        if (!wf || wf->sampleCount() == 0) continue;
        int st = lut.stationIndex(id.stationKey());
        if (st < 0) continue;

        double tt_p = lut.traveltimeAt(st, p_idx >= 0 ? p_idx : s_idx, source);
        double tt_s = lut.traveltimeAt(st, s_idx >= 0 ? s_idx : p_idx, source);

        // P window runs up to the S window; noise precedes the P window
        double pad = marginal_window_ / 2.0;
        double p_start = tt_p - pad - fraction_tt_ * tt_p;
        double s_start = tt_s - pad - fraction_tt_ * tt_s;
        double s_end = tt_s + settings_.signal_window + pad + fraction_tt_ * tt_s;
        if (s_idx < 0) s_start = s_end;

        TimePoint signal_start = addSeconds(event.origin_time, p_amp ? p_start : s_start);
        TimePoint signal_end = addSeconds(event.origin_time, p_amp ? s_start : s_end);
        TimePoint p_window_start = addSeconds(event.origin_time, p_start);
        TimePoint noise_start = addSeconds(p_window_start, -settings_.noise_window);

        StationMagnitude sm;
        sm.stream_id = id;
        const Point3& station = lut.stations()[st].position;
        sm.epicentral_distance = station.horizontalDistanceTo(source);
        sm.hypocentral_distance = station.distanceTo(source);
        sm.correction = correctionFor(id);
        for (const auto& pick : event.picks) {
            if (pick.valid && pick.station == id.stationKey()) sm.picked = true;
        }

        int64_t first = wf->indexAt(signal_start);
        int64_t last = wf->indexAt(signal_end);
        if (first < 0 || last >= static_cast<int64_t>(wf->sampleCount()) || last <= first) {
            continue;
        }
        bool gap = false;
        for (int64_t i = first; i <= last; i++) gap = gap || wf->isMissing(i);
        if (gap) continue;

        SampleVector data = prepare(*wf);
        halfPeakToPeak(data, wf->sampleRate(), static_cast<size_t>(first),
                       static_cast<size_t>(last), sm.amplitude, sm.period);

        int64_t n_first = std::max<int64_t>(0, wf->indexAt(noise_start));
        int64_t n_last = std::min<int64_t>(wf->indexAt(p_window_start),
                                           static_cast<int64_t>(wf->sampleCount()));
        std::vector<double> noise;
        for (int64_t i = n_first; i < n_last; i++) {
            if (!wf->isMissing(i)) noise.push_back(data[i]);
        }
        if (!noise.empty()) {
            double mean = std::accumulate(noise.begin(), noise.end(), 0.0) / noise.size();
            double acc = 0;
            for (double v : noise) {
                double d = settings_.noise_measure == "STD" ? v - mean : v;
                acc += d * d;
            }
            sm.noise_amplitude = std::sqrt(acc / noise.size());
        }

        if (!(sm.amplitude > 0)) {
            result.station_magnitudes.push_back(sm);
            continue;
        }

        double r = settings_.use_hyp_dist ? sm.hypocentral_distance : sm.epicentral_distance;
        sm.magnitude = std::log10(sm.amplitude * settings_.amp_multiplier)
                     + attenuation(settings_.a0, r) + sm.correction;

        sm.used = sm.amplitude > settings_.noise_filter * sm.noise_amplitude;
        if (settings_.dist_filter > 0 && r > settings_.dist_filter) sm.used = false;
        if (settings_.pick_filter && !sm.picked) sm.used = false;
        if (excluded(id)) sm.used = false;

        if (sm.used) {
            magnitudes.push_back(sm.magnitude);
            weights.push_back(settings_.weighted_mean
                              ? sm.amplitude / std::max(sm.noise_amplitude, 1e-12)
                              : 1.0);
        }
        result.station_magnitudes.push_back(sm);
    }

    if (magnitudes.empty()) {
        std::cerr << "LocalMagnitude: no usable amplitudes for event " << event.uid << std::endl;
        return result;
    }

    double wsum = std::accumulate(weights.begin(), weights.end(), 0.0);
    double mean = 0;
    for (size_t i = 0; i < magnitudes.size(); i++) mean += weights[i] * magnitudes[i];
    mean /= wsum;

    double var = 0;
    for (size_t i = 0; i < magnitudes.size(); i++) {
        var += weights[i] * (magnitudes[i] - mean) * (magnitudes[i] - mean);
    }
    result.value = mean;
    result.uncertainty = std::sqrt(var / wsum);
    result.station_count = static_cast<int>(magnitudes.size());
    return result;
}

} // namespace quakemigrate
