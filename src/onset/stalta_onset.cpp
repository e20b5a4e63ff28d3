#include "quakemigrate/onset/stalta_onset.hpp"
#include "quakemigrate/core/exception.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>

namespace quakemigrate {

STALTAOnset::STALTAOnset(const OnsetSettings& settings, OnsetPolicy policy)
    : settings_(settings)
    , policy_(policy)
{
}

std::string STALTAOnset::name() const {
    return "STA/LTA (" + onsetPolicyToString(policy_) + ")";
}

double STALTAOnset::prePadding() const {
    double lta = settings_.maxLta();
    return policy_ == OnsetPolicy::Classic ? lta : lta / 2.0;
}

double STALTAOnset::postPadding() const {
    return policy_ == OnsetPolicy::Classic ? 0.0 : settings_.maxLta() / 2.0;
}

void STALTAOnset::windowLengths(const PhaseOnsetSettings& phase, double sample_rate,
                                size_t& nsta, size_t& nlta) {
    nsta = static_cast<size_t>(std::max(1L, std::lround(phase.sta * sample_rate)));
    nlta = static_cast<size_t>(std::max(1L, std::lround(phase.lta * sample_rate)));
    if (nlta <= nsta) nlta = nsta + 1;
}

void STALTAOnset::staLta(const SampleVector& signal,
                         const std::vector<char>& missing,
                         size_t nsta, size_t nlta,
                         OnsetPolicy policy, bool log,
                         SampleVector& values,
                         std::vector<char>& available) {
    const size_t n = signal.size();
    values.assign(n, 0.0);
    available.assign(n, 0);
    if (n < nlta || nsta == 0) return;

    // Prefix sums of energy and of gap samples
    std::vector<double> energy(n + 1, 0.0);
    std::vector<size_t> gaps(n + 1, 0);
    for (size_t i = 0; i < n; i++) {
        energy[i + 1] = energy[i] + signal[i] * signal[i];
        gaps[i + 1] = gaps[i] + (missing[i] ? 1 : 0);
    }

    for (size_t t = 0; t < n; t++) {
        long sta_first, lta_first;
        if (policy == OnsetPolicy::Classic) {
            sta_first = static_cast<long>(t) - static_cast<long>(nsta) + 1;
            lta_first = static_cast<long>(t) - static_cast<long>(nlta) + 1;
        } else {
            sta_first = static_cast<long>(t) - static_cast<long>(nsta / 2);
            lta_first = static_cast<long>(t) - static_cast<long>(nlta / 2);
        }
        long lta_last = lta_first + static_cast<long>(nlta) - 1;
        if (lta_first < 0 || lta_last >= static_cast<long>(n)) continue;

        // The LTA window contains the STA window
        if (gaps[lta_last + 1] - gaps[lta_first] > 0) continue;

        double sta = std::max(0.0, energy[sta_first + nsta] - energy[sta_first]) / nsta;
        double lta = std::max(0.0, energy[lta_last + 1] - energy[lta_first]) / nlta;
        available[t] = 1;
        if (lta <= 0) continue;

        double ratio = sta / lta;
        values[t] = log ? std::max(std::log(ratio), 0.0) : std::max(ratio - 1.0, 0.0);
    }
}

OnsetTrace STALTAOnset::channelOnset(const Waveform& waveform,
                                     const PhaseOnsetSettings& phase) const {
    OnsetTrace trace;
    trace.station = waveform.streamId().stationKey();
    trace.start_time = waveform.startTime();
    trace.sample_rate = waveform.sampleRate();
    if (waveform.sampleCount() == 0) return trace;

    size_t nsta, nlta;
    windowLengths(phase, waveform.sampleRate(), nsta, nlta);

    Waveform work = waveform;
    SampleVector& data = work.data();
    std::vector<char> missing(data.size(), 0);
    for (size_t i = 0; i < data.size(); i++) missing[i] = std::isnan(data[i]) ? 1 : 0;

    IIRFilter bandpass;
    if (phase.filter) {
        bandpass = IIRFilter::butterworth(phase.corners, phase.low, phase.high,
                                          waveform.sampleRate());
    }

    if (policy_ == OnsetPolicy::Classic) {
        // Causal: only the first LTA window may set the offset
        work.demean(nlta);
        work.fillGaps(0.0);
        if (phase.filter) bandpass.apply(data);
    } else {
        work.demean();
        work.detrend();
        work.fillGaps(0.0);
        work.taper(settings_.taper_fraction);
        if (phase.filter) data = bandpass.filtfilt(data);
    }

    staLta(data, missing, nsta, nlta, policy_, settings_.log, trace.values, trace.available);
    return trace;
}

OnsetData STALTAOnset::compute(const WaveformMap& waveforms, const LookupTable& lut) const {
    OnsetData result(lut.stationCount(), lut.phaseCount());

    for (size_t s = 0; s < lut.stationCount(); s++) {
        const std::string& key = lut.stations()[s].id;

        for (size_t p = 0; p < lut.phaseCount(); p++) {
            PhaseType phase = lut.phases()[p];
            auto ps_it = settings_.phases.find(phase);
            if (ps_it == settings_.phases.end()) {
                throw ConfigError("onset: no settings for phase " + phaseTypeToString(phase));
            }
            const PhaseOnsetSettings& ps = ps_it->second;

            // One channel per component letter, first location code wins
            std::vector<WaveformPtr> channels;
            for (char comp : ps.components) {
                for (const auto& [id, wf] : waveforms) {
                    if (id.stationKey() == key && id.component() == comp &&
                        wf && wf->sampleCount() > 0) {
                        channels.push_back(wf);
                        break;
                    }
                }
            }
            if (channels.empty()) continue;

            double rate = channels.front()->sampleRate();
            for (const auto& wf : channels) {
                if (std::abs(wf->sampleRate() - rate) > 1e-6 * rate) {
                    std::ostringstream msg;
                    msg << "onset: station " << key << " has " << phaseTypeToString(phase)
                        << " channels with different sampling rates ("
                        << rate << " Hz, " << wf->sampleRate() << " Hz)";
                    throw ConfigError(msg.str());
                }
            }

            std::vector<OnsetTrace> parts;
            for (const auto& wf : channels) parts.push_back(channelOnset(*wf, ps));

            OnsetTrace& out = result.trace(s, p);
            if (parts.size() == 1) {
                out = std::move(parts.front());
            } else {
                // Average the components available at each sample
                TimePoint start = parts.front().start_time;
                for (const auto& part : parts) start = std::min(start, part.start_time);

                std::vector<long> offsets;
                size_t length = 0;
                for (const auto& part : parts) {
                    long off = std::lround(secondsBetween(start, part.start_time) * rate);
                    offsets.push_back(off);
                    length = std::max(length, static_cast<size_t>(off) + part.size());
                }

                out.start_time = start;
                out.sample_rate = rate;
                out.values.assign(length, 0.0);
                out.available.assign(length, 0);
                std::vector<int> counts(length, 0);
                for (size_t c = 0; c < parts.size(); c++) {
                    for (size_t i = 0; i < parts[c].size(); i++) {
                        if (!parts[c].available[i]) continue;
                        size_t idx = static_cast<size_t>(offsets[c]) + i;
                        out.values[idx] += parts[c].values[i];
                        counts[idx]++;
                    }
                }
                for (size_t i = 0; i < length; i++) {
                    if (counts[i] > 0) {
                        out.values[i] /= counts[i];
                        out.available[i] = 1;
                    }
                }
            }
            out.station = key;
            out.phase = phase;
        }
    }
    return result;
}

} // namespace quakemigrate
