#include "quakemigrate/trigger/trigger.hpp"
#include "quakemigrate/core/time_util.hpp"
#include <algorithm>
#include <cmath>

namespace quakemigrate {

TriggerEngine::TriggerEngine(const TriggerSettings& settings)
    : settings_(settings)
{
}

std::vector<double> TriggerEngine::thresholds(const CoalescenceSeries& series) const {
    std::vector<double> out(series.size(), settings_.threshold);
    if (settings_.method == ThresholdMethod::Static) return out;

    // Running sums over the samples in [t - window, t)
    double sum = 0, sum_sq = 0;
    size_t first = 0;
    for (size_t i = 0; i < series.size(); i++) {
        TimePoint window_start = addSeconds(series[i].time, -settings_.window);
        while (first < i && series[first].time < window_start) {
            double q = quantity(series[first]);
            sum -= q;
            sum_sq -= q * q;
            first++;
        }

        size_t n = i - first;
        if (n > 0) {
            double mean = sum / n;
            double var = std::max(0.0, sum_sq / n - mean * mean);
            out[i] = std::max(settings_.threshold,
                              mean + settings_.multiplier * std::sqrt(var));
        }

        double q = quantity(series[i]);
        sum += q;
        sum_sq += q * q;
    }
    return out;
}

std::vector<Trigger> TriggerEngine::run(const CoalescenceSeries& series) const {
    std::vector<Trigger> triggers;
    if (series.empty()) return triggers;

    std::vector<double> thr = thresholds(series);

    bool above = false;
    Trigger current;
    double current_peak = 0;
    double last_peak = 0;

    auto emit = [&](TimePoint end) {
        current.end_time = end;
        // An exceedance that begins inside the cooldown of the previous peak
        if (!triggers.empty() &&
            secondsBetween(triggers.back().peak_time, current.start_time) <= settings_.min_event_interval) {
            Trigger& prev = triggers.back();
            prev.end_time = current.end_time;
            if (current_peak > last_peak) {
                TimePoint start = prev.start_time;
                prev = current;
                prev.start_time = start;
                last_peak = current_peak;
            }
            return;
        }
        triggers.push_back(current);
        last_peak = current_peak;
    };

    for (size_t i = 0; i < series.size(); i++) {
        const CoalescenceSample& s = series[i];
        double q = quantity(s);

        if (q > thr[i]) {
            if (!above || q > current_peak) {
                if (!above) {
                    current = Trigger();
                    current.start_time = s.time;
                }
                current.peak_time = s.time;
                current.peak_value = s.value;
                current.peak_normalised = s.normalised;
                current.node = s.node;
                current.position = s.position;
                current.threshold = thr[i];
                current_peak = q;
            }
            above = true;
        } else if (above) {
            emit(series[i - 1].time);
            above = false;
        }
    }
    if (above) emit(series.back().time);

    for (size_t i = 0; i < triggers.size(); i++) {
        triggers[i].event_num = static_cast<int>(i + 1);
        triggers[i].uid = formatUid(triggers[i].peak_time);
    }
    return triggers;
}

std::vector<Trigger> TriggerEngine::run(const CoalescenceSeries& series,
                                        TimePoint start, TimePoint end) const {
    std::vector<Trigger> all = run(series);
    std::vector<Trigger> kept;
    for (const auto& t : all) {
        if (t.peak_time >= start && t.peak_time < end) kept.push_back(t);
    }
    for (size_t i = 0; i < kept.size(); i++) {
        kept[i].event_num = static_cast<int>(i + 1);
    }
    return kept;
}

} // namespace quakemigrate
