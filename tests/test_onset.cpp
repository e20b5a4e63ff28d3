/**
 * Unit tests for filters and STA/LTA onset functions
 */

#include "test_framework.hpp"
#include "quakemigrate/core/exception.hpp"
#include "quakemigrate/core/time_util.hpp"
#include "quakemigrate/onset/filter.hpp"
#include "quakemigrate/onset/stalta_onset.hpp"
#include <random>

using namespace quakemigrate;
using namespace quakemigrate::test;

namespace {

TimePoint t0() {
    TimePoint t;
    parseTime("2021-03-04T00:00:00", t);
    return t;
}

WaveformPtr noiseTrace(const StreamID& id, double rate, size_t n, unsigned seed) {
    std::mt19937 gen(seed);
    std::normal_distribution<double> noise(0.0, 1.0);
    auto wf = std::make_shared<Waveform>(id, rate, t0());
    for (size_t i = 0; i < n; i++) wf->append(noise(gen));
    return wf;
}

LookupTable singleStationLut() {
    LookupTable lut;
    HomogeneousVelocityModel model(5.0, 3.0);
    lut.build(Grid3D(Point3(0, 0, 0), Point3(4, 4, 4), Point3(2, 2, 2)),
              {LutStation("XX.A", Point3(0, 0, 0))},
              {PhaseType::P, PhaseType::S}, model);
    return lut;
}

PhaseOnsetSettings unfiltered(double sta, double lta) {
    PhaseOnsetSettings p;
    p.sta = sta;
    p.lta = lta;
    p.filter = false;
    return p;
}

} // namespace

// ============================================================================
// IIRFilter Tests
// ============================================================================

TEST(IIRFilter, LowpassPassesDC) {
    IIRFilter f = IIRFilter::butterworthLowpass(4, 1.0, 100.0);
    ASSERT_EQ(f.sections().size(), 2u);
    SampleVector out = f.filter(SampleVector(3000, 1.0));
    ASSERT_NEAR(out.back(), 1.0, 1e-6);
}

TEST(IIRFilter, HighpassRemovesDC) {
    IIRFilter f = IIRFilter::butterworthHighpass(3, 1.0, 100.0);
    ASSERT_EQ(f.sections().size(), 2u);
    SampleVector out = f.filter(SampleVector(3000, 1.0));
    ASSERT_NEAR(out.back(), 0.0, 1e-6);
}

TEST(IIRFilter, BandpassAttenuatesOutOfBand) {
    IIRFilter f = IIRFilter::butterworth(4, 2.0, 8.0, 100.0);
    SampleVector in_band(4000), out_band(4000);
    for (size_t i = 0; i < in_band.size(); i++) {
        double t = i / 100.0;
        in_band[i] = std::sin(2 * M_PI * 4.0 * t);
        out_band[i] = std::sin(2 * M_PI * 30.0 * t);
    }
    SampleVector a = f.filtfilt(in_band);
    SampleVector b = f.filtfilt(out_band);
    double max_a = 0, max_b = 0;
    for (size_t i = 1000; i < 3000; i++) {
        max_a = std::max(max_a, std::abs(a[i]));
        max_b = std::max(max_b, std::abs(b[i]));
    }
    ASSERT_GT(max_a, 0.8);
    ASSERT_LT(max_b, 0.05);
}

TEST(IIRFilter, FiltfiltIsZeroPhase) {
    IIRFilter f = IIRFilter::butterworthLowpass(2, 5.0, 100.0);
    SampleVector pulse(401, 0.0);
    pulse[200] = 1.0;
    SampleVector out = f.filtfilt(pulse);
    size_t peak = 0;
    for (size_t i = 0; i < out.size(); i++) {
        if (out[i] > out[peak]) peak = i;
    }
    ASSERT_EQ(peak, 200u);
    ASSERT_NEAR(out[190], out[210], 1e-6);
}

TEST(IIRFilter, RejectsCornerAboveNyquist) {
    ASSERT_THROW(IIRFilter::butterworthLowpass(2, 60.0, 100.0), ConfigError);
    ASSERT_THROW(IIRFilter::butterworth(2, 2.0, 50.0, 100.0), ConfigError);
    ASSERT_THROW(IIRFilter::butterworth(2, 8.0, 2.0, 100.0), ConfigError);
    ASSERT_THROW(IIRFilter::butterworthHighpass(0, 1.0, 100.0), ConfigError);
}

// ============================================================================
// STA/LTA Tests
// ============================================================================

TEST(StaLta, ClassicStep) {
    SampleVector signal = {1, 1, 1, 1, 1, 1, 3, 3};
    std::vector<char> missing(signal.size(), 0);
    SampleVector values;
    std::vector<char> available;
    STALTAOnset::staLta(signal, missing, 2, 4, OnsetPolicy::Classic, false, values, available);

    ASSERT_EQ(values.size(), signal.size());
    for (size_t t = 0; t < 3; t++) ASSERT_FALSE(available[t]);
    for (size_t t = 3; t < 6; t++) {
        ASSERT_TRUE(available[t]);
        ASSERT_NEAR(values[t], 0.0, 1e-12);
    }
    // STA (1 + 9) / 2 over LTA (1 + 1 + 1 + 9) / 4
    ASSERT_NEAR(values[6], 5.0 / 3.0 - 1.0, 1e-12);
    ASSERT_NEAR(values[7], 9.0 / 5.0 - 1.0, 1e-12);
}

TEST(StaLta, LogMode) {
    SampleVector signal = {1, 1, 1, 1, 1, 1, 3, 3};
    std::vector<char> missing(signal.size(), 0);
    SampleVector values;
    std::vector<char> available;
    STALTAOnset::staLta(signal, missing, 2, 4, OnsetPolicy::Classic, true, values, available);
    ASSERT_NEAR(values[6], std::log(5.0 / 3.0), 1e-12);
    ASSERT_NEAR(values[4], 0.0, 1e-12);
}

TEST(StaLta, CentredEdges) {
    SampleVector signal(10, 2.0);
    std::vector<char> missing(signal.size(), 0);
    SampleVector values;
    std::vector<char> available;
    STALTAOnset::staLta(signal, missing, 2, 4, OnsetPolicy::Centred, false, values, available);

    // The LTA window spans [t - 2, t + 1]
    ASSERT_FALSE(available[0]);
    ASSERT_FALSE(available[1]);
    for (size_t t = 2; t <= 8; t++) ASSERT_TRUE(available[t]);
    ASSERT_FALSE(available[9]);
}

TEST(StaLta, GapMarksWindowsUnavailable) {
    SampleVector signal(20, 1.0);
    std::vector<char> missing(signal.size(), 0);
    missing[10] = 1;
    signal[10] = 0.0;
    SampleVector values;
    std::vector<char> available;
    STALTAOnset::staLta(signal, missing, 2, 4, OnsetPolicy::Classic, false, values, available);

    ASSERT_TRUE(available[9]);
    for (size_t t = 10; t <= 13; t++) ASSERT_FALSE(available[t]);
    ASSERT_TRUE(available[14]);
    ASSERT_NEAR(values[14], 0.0, 1e-12);
}

TEST(StaLta, ShortSignal) {
    SampleVector signal = {1, 2};
    std::vector<char> missing(signal.size(), 0);
    SampleVector values;
    std::vector<char> available;
    STALTAOnset::staLta(signal, missing, 2, 4, OnsetPolicy::Classic, false, values, available);
    ASSERT_EQ(values.size(), 2u);
    ASSERT_FALSE(available[0]);
    ASSERT_FALSE(available[1]);
}

// ============================================================================
// OnsetTrace Tests
// ============================================================================

TEST(OnsetTrace, LinearInterpolation) {
    OnsetTrace trace;
    trace.start_time = t0();
    trace.sample_rate = 4.0;
    trace.values = {0, 1, 2, 3};
    trace.available = {1, 1, 0, 1};

    double v = -1;
    ASSERT_TRUE(trace.valueAt(addSeconds(t0(), 0.125), v));
    ASSERT_NEAR(v, 0.5, 1e-12);
    ASSERT_TRUE(trace.valueAt(addSeconds(t0(), 0.25), v));
    ASSERT_NEAR(v, 1.0, 1e-12);
    // Needs both neighbours
    ASSERT_FALSE(trace.valueAt(addSeconds(t0(), 0.375), v));
    ASSERT_FALSE(trace.valueAt(addSeconds(t0(), 0.5), v));
    ASSERT_TRUE(trace.valueAt(addSeconds(t0(), 0.75), v));
    ASSERT_NEAR(v, 3.0, 1e-12);
    // Outside the trace
    ASSERT_FALSE(trace.valueAt(addSeconds(t0(), -0.125), v));
    ASSERT_FALSE(trace.valueAt(addSeconds(t0(), 1.0), v));
    ASSERT_EQ(trace.availableCount(), 3u);
}

// ============================================================================
// STALTAOnset Tests
// ============================================================================

TEST(STALTAOnset, Padding) {
    OnsetSettings settings;
    settings.phases[PhaseType::P].lta = 4.0;
    settings.phases[PhaseType::S].lta = 6.0;

    STALTAOnset classic(settings, OnsetPolicy::Classic);
    ASSERT_NEAR(classic.prePadding(), 6.0, 1e-12);
    ASSERT_NEAR(classic.postPadding(), 0.0, 1e-12);

    STALTAOnset centred(settings, OnsetPolicy::Centred);
    ASSERT_NEAR(centred.prePadding(), 3.0, 1e-12);
    ASSERT_NEAR(centred.postPadding(), 3.0, 1e-12);
}

TEST(STALTAOnset, ClassicIsCausal) {
    OnsetSettings settings;
    PhaseOnsetSettings p;
    p.sta = 0.2;
    p.lta = 2.0;
    p.low = 2.0;
    p.high = 16.0;
    p.corners = 2;

    StreamID id("XX", "A", "", "HHZ");
    WaveformPtr full = noiseTrace(id, 100.0, 6000, 7);
    for (size_t i = 4000; i < 4050; i++) full->data()[i] += 40.0 * std::sin(0.9 * i);
    Waveform head = full->slice(full->startTime(), full->timeAt(3499));

    STALTAOnset onset(settings, OnsetPolicy::Classic);
    OnsetTrace a = onset.channelOnset(*full, p);
    OnsetTrace b = onset.channelOnset(head, p);

    ASSERT_EQ(b.size(), 3500u);
    for (size_t i = 0; i < b.size(); i++) {
        ASSERT_EQ(a.available[i], b.available[i]);
        ASSERT_NEAR(a.values[i], b.values[i], 1e-12);
    }
    // Nothing usable before the first full LTA window
    ASSERT_FALSE(a.available[198]);
    ASSERT_TRUE(a.available[199]);
}

TEST(STALTAOnset, RisesOnArrival) {
    OnsetSettings settings;
    PhaseOnsetSettings p;
    p.sta = 0.2;
    p.lta = 5.0;
    StreamID id("XX", "A", "", "HHZ");
    WaveformPtr wf = noiseTrace(id, 100.0, 3000, 11);
    for (size_t i = 2000; i < 2100; i++) {
        wf->data()[i] += 30.0 * std::sin(2 * M_PI * 8.0 * (i - 2000) / 100.0);
    }

    STALTAOnset onset(settings, OnsetPolicy::Classic);
    OnsetTrace trace = onset.channelOnset(*wf, p);
    double before = 0, after = 0;
    for (size_t i = 600; i < 1990; i++) before = std::max(before, trace.values[i]);
    for (size_t i = 2000; i < 2100; i++) after = std::max(after, trace.values[i]);
    ASSERT_GT(after, 3.0 * std::max(before, 0.1));
    for (double v : trace.values) ASSERT_GE(v, 0.0);
}

TEST(STALTAOnset, ComputeFollowsLutOrder) {
    OnsetSettings settings;
    settings.phases[PhaseType::P] = unfiltered(0.2, 1.0);
    settings.phases[PhaseType::P].components = {'Z'};
    settings.phases[PhaseType::S] = unfiltered(0.2, 1.0);
    settings.phases[PhaseType::S].components = {'N', 'E'};

    WaveformMap waveforms;
    StreamID z("XX", "A", "", "HHZ");
    StreamID n("XX", "A", "", "HHN");
    StreamID e("XX", "A", "", "HHE");
    StreamID other("XX", "B", "", "HHZ");
    waveforms[z] = noiseTrace(z, 50.0, 500, 1);
    waveforms[n] = noiseTrace(n, 50.0, 500, 2);
    waveforms[e] = noiseTrace(e, 50.0, 500, 3);
    waveforms[other] = noiseTrace(other, 50.0, 500, 4);

    LookupTable lut = singleStationLut();
    STALTAOnset onset(settings, OnsetPolicy::Classic);
    OnsetData data = onset.compute(waveforms, lut);

    ASSERT_EQ(data.stationCount(), 1u);
    ASSERT_EQ(data.phaseCount(), 2u);
    ASSERT_EQ(data.presentCount(), 2u);

    const OnsetTrace& p = data.trace(0, 0);
    ASSERT_EQ(p.station, "XX.A");
    ASSERT_TRUE(p.phase == PhaseType::P);
    OnsetTrace z_only = onset.channelOnset(*waveforms[z], settings.phases[PhaseType::P]);
    ASSERT_NEAR(p.values[300], z_only.values[300], 1e-12);

    // Horizontal components are averaged
    const OnsetTrace& s = data.trace(0, 1);
    ASSERT_TRUE(s.phase == PhaseType::S);
    OnsetTrace n_only = onset.channelOnset(*waveforms[n], settings.phases[PhaseType::S]);
    OnsetTrace e_only = onset.channelOnset(*waveforms[e], settings.phases[PhaseType::S]);
    for (size_t i = 0; i < s.size(); i++) {
        ASSERT_EQ(s.available[i], n_only.available[i]);
        if (s.available[i]) {
            ASSERT_NEAR(s.values[i], 0.5 * (n_only.values[i] + e_only.values[i]), 1e-12);
        }
    }
}

TEST(STALTAOnset, MissingStationLeavesEmptyTrace) {
    OnsetSettings settings;
    WaveformMap waveforms;
    StreamID other("XX", "B", "", "HHZ");
    waveforms[other] = noiseTrace(other, 50.0, 500, 4);

    LookupTable lut = singleStationLut();
    STALTAOnset onset(settings, OnsetPolicy::Centred);
    OnsetData data = onset.compute(waveforms, lut);
    ASSERT_EQ(data.presentCount(), 0u);
    ASSERT_TRUE(data.trace(0, 1).empty());
}

TEST(STALTAOnset, RejectsMixedSampleRates) {
    OnsetSettings settings;
    WaveformMap waveforms;
    StreamID n("XX", "A", "", "HHN");
    StreamID e("XX", "A", "", "HHE");
    waveforms[n] = noiseTrace(n, 100.0, 1000, 2);
    waveforms[e] = noiseTrace(e, 50.0, 500, 3);

    LookupTable lut = singleStationLut();
    STALTAOnset onset(settings, OnsetPolicy::Classic);
    ASSERT_THROW(onset.compute(waveforms, lut), ConfigError);
}

TEST(STALTAOnset, RejectsCornerAboveNyquist) {
    OnsetSettings settings;
    PhaseOnsetSettings p;
    p.low = 2.0;
    p.high = 30.0;
    StreamID id("XX", "A", "", "HHZ");
    WaveformPtr wf = noiseTrace(id, 50.0, 500, 5);

    STALTAOnset onset(settings, OnsetPolicy::Classic);
    ASSERT_THROW(onset.channelOnset(*wf, p), ConfigError);
}

TEST(STALTAOnset, GapInWaveform) {
    OnsetSettings settings;
    PhaseOnsetSettings p = unfiltered(0.1, 0.5);
    StreamID id("XX", "A", "", "HHZ");
    WaveformPtr wf = noiseTrace(id, 100.0, 1000, 9);
    for (size_t i = 500; i < 520; i++) wf->data()[i] = std::nan("");

    STALTAOnset onset(settings, OnsetPolicy::Classic);
    OnsetTrace trace = onset.channelOnset(*wf, p);
    ASSERT_TRUE(trace.available[499]);
    // LTA of 50 samples reaches back over the gap
    for (size_t i = 500; i < 569; i++) ASSERT_FALSE(trace.available[i]);
    ASSERT_TRUE(trace.available[569]);
    for (double v : trace.values) ASSERT_TRUE(std::isfinite(v));
}
