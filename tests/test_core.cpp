/**
 * Unit tests for core components
 */

#include "test_framework.hpp"
#include "quakemigrate/core/types.hpp"
#include "quakemigrate/core/waveform.hpp"
#include "quakemigrate/core/station.hpp"
#include "quakemigrate/core/event.hpp"
#include "quakemigrate/core/config.hpp"
#include "quakemigrate/core/settings.hpp"
#include "quakemigrate/core/exception.hpp"
#include "quakemigrate/core/time_util.hpp"
#include "quakemigrate/core/archive.hpp"
#include <cstdio>
#include <fstream>

using namespace quakemigrate;
using namespace quakemigrate::test;

namespace {

// Smallest configuration that passes validation
Config minimalConfig() {
    Config config;
    config.set("grid.ll_corner", "-10, -10, 0");
    config.set("grid.ur_corner", "10, 10, 10");
    config.set("grid.node_spacing", "2, 2, 2");
    return config;
}

} // namespace

// ============================================================================
// Point3 / GeoPoint Tests
// ============================================================================

TEST(Point3, Distance) {
    Point3 a(0, 0, 0);
    Point3 b(3, 4, 12);
    ASSERT_NEAR(a.distanceTo(b), 13.0, 1e-12);
    ASSERT_NEAR(a.horizontalDistanceTo(b), 5.0, 1e-12);
}

TEST(Point3, AxisAccess) {
    Point3 p(1, 2, 3);
    ASSERT_NEAR(p[0], 1.0, 1e-12);
    ASSERT_NEAR(p[1], 2.0, 1e-12);
    ASSERT_NEAR(p[2], 3.0, 1e-12);
    p[2] = 7;
    ASSERT_NEAR(p.z, 7.0, 1e-12);
}

// ============================================================================
// StreamID Tests
// ============================================================================

TEST(StreamID, ToString) {
    StreamID id("GB", "ESK", "00", "HHZ");
    ASSERT_EQ(id.toString(), "GB.ESK.00.HHZ");
    ASSERT_EQ(id.stationKey(), "GB.ESK");
    ASSERT_EQ(id.component(), 'Z');
}

TEST(StreamID, EmptyChannelComponent) {
    StreamID id("GB", "ESK", "", "");
    ASSERT_EQ(id.component(), '?');
}

TEST(StreamID, Ordering) {
    StreamID a("GB", "ESK", "", "HHE");
    StreamID b("GB", "ESK", "", "HHN");
    StreamID c("GB", "KESW", "", "HHE");
    ASSERT_TRUE(a < b);
    ASSERT_TRUE(b < c);
    ASSERT_FALSE(b < a);
}

// ============================================================================
// Time Utility Tests
// ============================================================================

TEST(TimeUtil, ParseAndFormat) {
    TimePoint t;
    ASSERT_TRUE(parseTime("2021-03-04T05:06:07.123456", t));
    ASSERT_EQ(formatTime(t), "2021-03-04T05:06:07.123456");
    ASSERT_EQ(formatUid(t), "20210304050607123456");
}

TEST(TimeUtil, ParseDateOnly) {
    TimePoint t;
    ASSERT_TRUE(parseTime("2021-03-04", t));
    ASSERT_EQ(formatTime(t), "2021-03-04T00:00:00.000000");
}

TEST(TimeUtil, ParseSpaceSeparator) {
    TimePoint a, b;
    ASSERT_TRUE(parseTime("2021-03-04 05:06:07", a));
    ASSERT_TRUE(parseTime("2021-03-04T05:06:07Z", b));
    ASSERT_TRUE(a == b);
}

TEST(TimeUtil, RejectsMalformed) {
    TimePoint t;
    ASSERT_FALSE(parseTime("", t));
    ASSERT_FALSE(parseTime("yesterday", t));
    ASSERT_FALSE(parseTime("2021-13-01", t));
    ASSERT_FALSE(parseTime("2021-03-04T25:00:00", t));
    ASSERT_FALSE(parseTime("2021-03-04T05:06:07 junk", t));
}

TEST(TimeUtil, DayLabel) {
    TimePoint t;
    ASSERT_TRUE(parseTime("2021-02-01T23:59:59.999999", t));
    ASSERT_EQ(dayLabel(t), "2021_032");

    int year, jday;
    yearAndJulianDay(t, year, jday);
    ASSERT_EQ(year, 2021);
    ASSERT_EQ(jday, 32);
}

TEST(TimeUtil, StartOfDay) {
    TimePoint t, midnight;
    ASSERT_TRUE(parseTime("2021-03-04T17:30:00.5", t));
    ASSERT_TRUE(parseTime("2021-03-04", midnight));
    ASSERT_TRUE(startOfDay(t) == midnight);
    ASSERT_TRUE(startOfDay(midnight) == midnight);
}

TEST(TimeUtil, AddSecondsRoundsToMicroseconds) {
    TimePoint t;
    ASSERT_TRUE(parseTime("2021-03-04", t));
    TimePoint u = addSeconds(t, 0.1 * 3);
    ASSERT_EQ(formatTime(u), "2021-03-04T00:00:00.300000");
    ASSERT_NEAR(secondsBetween(t, u), 0.3, 1e-9);
    ASSERT_NEAR(secondsBetween(u, t), -0.3, 1e-9);
}

// ============================================================================
// Waveform Tests
// ============================================================================

TEST(Waveform, Basics) {
    TimePoint t0;
    ASSERT_TRUE(parseTime("2021-03-04", t0));
    Waveform wf(StreamID("GB", "ESK", "", "HHZ"), 100.0, t0);
    for (int i = 0; i < 100; i++) wf.append(i);

    ASSERT_EQ(wf.sampleCount(), 100u);
    ASSERT_NEAR(secondsBetween(t0, wf.endTime()), 0.99, 1e-9);
    ASSERT_EQ(wf.indexAt(addSeconds(t0, 0.505)), 50);
    ASSERT_EQ(wf.indexAt(addSeconds(t0, -0.005)), -1);
}

TEST(Waveform, StatisticsSkipGaps) {
    TimePoint t0;
    ASSERT_TRUE(parseTime("2021-03-04", t0));
    Waveform wf(StreamID("GB", "ESK", "", "HHZ"), 10.0, t0);
    wf.append({1.0, std::nan(""), 3.0, -5.0});

    ASSERT_EQ(wf.gapCount(), 1u);
    ASSERT_TRUE(wf.isMissing(1));
    ASSERT_NEAR(wf.mean(), -1.0 / 3.0, 1e-12);
    ASSERT_NEAR(wf.mean(2), 1.0, 1e-12);

    // Offset taken from the leading samples only
    wf.demean(1);
    ASSERT_NEAR(wf[0], 0.0, 1e-12);
    ASSERT_NEAR(wf[3], -6.0, 1e-12);
    ASSERT_EQ(wf.fillGaps(0.0), 1u);
    ASSERT_EQ(wf.gapCount(), 0u);
    ASSERT_NEAR(wf[1], 0.0, 1e-12);
}

TEST(Waveform, DetrendRemovesLine) {
    TimePoint t0;
    ASSERT_TRUE(parseTime("2021-03-04", t0));
    Waveform wf(StreamID("GB", "ESK", "", "HHZ"), 10.0, t0);
    for (int i = 0; i < 50; i++) wf.append(3.0 + 0.25 * i);
    wf.detrend();
    for (size_t i = 0; i < wf.sampleCount(); i++) {
        ASSERT_NEAR(wf[i], 0.0, 1e-9);
    }
}

TEST(Waveform, TimeSlice) {
    TimePoint t0;
    ASSERT_TRUE(parseTime("2021-03-04", t0));
    Waveform wf(StreamID("GB", "ESK", "", "HHZ"), 10.0, t0);
    for (int i = 0; i < 100; i++) wf.append(i);

    Waveform s = wf.slice(addSeconds(t0, 1.0), addSeconds(t0, 2.0));
    ASSERT_EQ(s.sampleCount(), 11u);
    ASSERT_NEAR(s[0], 10.0, 1e-12);
    ASSERT_NEAR(s[10], 20.0, 1e-12);
    ASSERT_TRUE(s.startTime() == addSeconds(t0, 1.0));
}

TEST(Waveform, MergeFillsGapWithNaN) {
    TimePoint t0;
    ASSERT_TRUE(parseTime("2021-03-04", t0));
    StreamID id("GB", "ESK", "", "HHZ");
    Waveform a(id, 10.0, t0);
    a.append({1, 2, 3});
    Waveform b(id, 10.0, addSeconds(t0, 0.5));
    b.append({6, 7});

    ASSERT_TRUE(a.merge(b));
    ASSERT_EQ(a.sampleCount(), 7u);
    ASSERT_NEAR(a[2], 3.0, 1e-12);
    ASSERT_TRUE(a.isMissing(3));
    ASSERT_TRUE(a.isMissing(4));
    ASSERT_NEAR(a[5], 6.0, 1e-12);
}

TEST(Waveform, MergeOverlapKeepsExisting) {
    TimePoint t0;
    ASSERT_TRUE(parseTime("2021-03-04", t0));
    StreamID id("GB", "ESK", "", "HHZ");
    Waveform a(id, 10.0, addSeconds(t0, 0.2));
    a.append({10, 11, 12});
    Waveform b(id, 10.0, t0);
    b.append({0, 1, 2, 3});

    ASSERT_TRUE(a.merge(b));
    ASSERT_TRUE(a.startTime() == t0);
    ASSERT_EQ(a.sampleCount(), 5u);
    ASSERT_NEAR(a[1], 1.0, 1e-12);
    ASSERT_NEAR(a[2], 10.0, 1e-12);
    ASSERT_NEAR(a[3], 11.0, 1e-12);
}

TEST(Waveform, MergeRejectsRateChange) {
    TimePoint t0;
    ASSERT_TRUE(parseTime("2021-03-04", t0));
    StreamID id("GB", "ESK", "", "HHZ");
    Waveform a(id, 10.0, t0);
    a.append(1);
    Waveform b(id, 20.0, t0);
    b.append(1);
    ASSERT_FALSE(a.merge(b));
}

TEST(MemoryArchive, ReadCutsSpan) {
    TimePoint t0;
    ASSERT_TRUE(parseTime("2021-03-04", t0));
    StreamID id("GB", "ESK", "", "HHZ");
    auto wf = std::make_shared<Waveform>(id, 10.0, t0);
    for (int i = 0; i < 100; i++) wf->append(i);

    MemoryArchive archive;
    archive.add(wf);
    ASSERT_EQ(archive.size(), 1u);

    WaveformMap span = archive.read(addSeconds(t0, 2.0), addSeconds(t0, 3.0));
    ASSERT_EQ(span.size(), 1u);
    ASSERT_EQ(span[id]->sampleCount(), 11u);

    WaveformMap none = archive.read(addSeconds(t0, 20.0), addSeconds(t0, 30.0));
    ASSERT_TRUE(none.empty());
}

// ============================================================================
// Station / Projection Tests
// ============================================================================

TEST(Projection, RoundTrip) {
    LocalTangentProjection proj(54.5, -3.2);
    GeoPoint geo(54.7, -3.0, 4.5);
    Point3 xyz = proj.forward(geo);
    ASSERT_GT(xyz.x, 0.0);
    ASSERT_NEAR(xyz.y, 0.2 * constants::KM_PER_DEG, 1e-9);
    ASSERT_NEAR(xyz.z, 4.5, 1e-12);

    GeoPoint back = proj.inverse(xyz);
    ASSERT_NEAR(back.latitude, 54.7, 1e-9);
    ASSERT_NEAR(back.longitude, -3.0, 1e-9);
    ASSERT_NEAR(back.depth, 4.5, 1e-12);
}

TEST(Projection, ReferenceIsOrigin) {
    LocalTangentProjection proj(10.0, 179.5);
    Point3 o = proj.forward(GeoPoint(10.0, 179.5, 0));
    ASSERT_NEAR(o.x, 0.0, 1e-12);
    ASSERT_NEAR(o.y, 0.0, 1e-12);

    // Across the antimeridian
    Point3 east = proj.forward(GeoPoint(10.0, -179.5, 0));
    ASSERT_GT(east.x, 0.0);
    ASSERT_LT(east.x, 120.0);
}

TEST(StationInventory, LoadAndProject) {
    std::string path = scratchPath(".txt");
    {
        std::ofstream out(path);
        out << "# network station lat lon elev\n";
        out << "GB ESK 55.3 -3.2 263\n";
        out << "\n";
        out << "GB,KESW,54.6,-3.1\n";
    }

    StationInventory inv;
    ASSERT_TRUE(inv.loadFromFile(path));
    ASSERT_EQ(inv.size(), 2u);

    StationPtr esk = inv.getStation("GB.ESK");
    ASSERT_TRUE(esk != nullptr);
    ASSERT_NEAR(esk->elevation(), 263.0, 1e-12);
    ASSERT_NEAR(esk->position().z, -0.263, 1e-12);

    LocalTangentProjection proj(55.3, -3.2);
    inv.project(proj);
    ASSERT_NEAR(esk->position().x, 0.0, 1e-9);
    ASSERT_NEAR(esk->position().y, 0.0, 1e-9);
    ASSERT_LT(inv.getStation("GB.KESW")->position().y, -70.0);

    std::remove(path.c_str());
}

TEST(StationInventory, CentroidAcrossAntimeridian) {
    StationInventory inv;
    inv.addStation(std::make_shared<Station>("XX", "W", -17.0, 179.0));
    inv.addStation(std::make_shared<Station>("XX", "E", -19.0, -179.0));
    GeoPoint c = inv.centroid();
    ASSERT_NEAR(c.latitude, -18.0, 1e-12);
    ASSERT_NEAR(std::abs(c.longitude), 180.0, 1e-9);
    ASSERT_NEAR(StationInventory().centroid().latitude, 0.0, 1e-12);
}

TEST(StationInventory, DuplicateStationFailsLoad) {
    std::string path = scratchPath(".txt");
    {
        std::ofstream out(path);
        out << "GB ESK 55.3 -3.2\n";
        out << "GB ESK 55.4 -3.2\n";
    }
    StationInventory inv;
    ASSERT_FALSE(inv.loadFromFile(path));
    ASSERT_EQ(inv.size(), 1u);
    ASSERT_NEAR(inv.getStation("GB.ESK")->location().latitude, 55.3, 1e-12);
    std::remove(path.c_str());
}

TEST(StationInventory, BadLineFailsLoad) {
    std::string path = scratchPath(".txt");
    {
        std::ofstream out(path);
        out << "GB ESK 55.3 -3.2\n";
        out << "GB BROKEN north west\n";
    }
    StationInventory inv;
    ASSERT_FALSE(inv.loadFromFile(path));
    ASSERT_EQ(inv.size(), 1u);
    std::remove(path.c_str());
}

// ============================================================================
// Config Tests
// ============================================================================

TEST(Config, LoadFromFile) {
    std::string path = scratchPath(".conf");
    {
        std::ofstream out(path);
        out << "# comment\n";
        out << "[scan]\n";
        out << "sampling_rate = 50\n";
        out << "threads = 4\n";
        out << "[lut]\n";
        out << "phases = P, S\n";
    }

    Config config;
    ASSERT_TRUE(config.loadFromFile(path));
    ASSERT_NEAR(config.getDouble("scan.sampling_rate"), 50.0, 1e-12);
    ASSERT_EQ(config.getInt("scan.threads"), 4);
    ASSERT_EQ(config.getStringList("lut.phases").size(), 2u);
    ASSERT_EQ(config.getString("lut.missing", "fallback"), "fallback");
    std::remove(path.c_str());
}

TEST(Config, MissingFile) {
    Config config;
    ASSERT_FALSE(config.loadFromFile("/tmp/quakemigrate_no_such_file.conf"));
}

TEST(Config, MalformedLine) {
    std::string path = scratchPath(".conf");
    {
        std::ofstream out(path);
        out << "[grid]\n";
        out << "node_spacing = 2, 2, 2   # km\n";
        out << "ll_corner -10, -10, 0\n";
    }
    Config config;
    ASSERT_THROW(config.loadFromFile(path), ConfigError);
    ASSERT_EQ(config.getPoint3("grid.node_spacing", Point3()).z, 2.0);
    config.set("grid.ll_corner", "-10, -10");
    ASSERT_THROW(config.getPoint3("grid.ll_corner", Point3()), ConfigError);
    std::remove(path.c_str());
}

TEST(Config, TypedGettersReject) {
    Config config;
    config.set("scan.threads", "four");
    config.set("scan.sampling_rate", "20 Hz");
    config.set("output.verbose", "maybe");
    ASSERT_THROW(config.getInt("scan.threads"), ConfigError);
    ASSERT_THROW(config.getDouble("scan.sampling_rate"), ConfigError);
    ASSERT_THROW(config.getBool("output.verbose"), ConfigError);
}

TEST(Config, Booleans) {
    Config config;
    config.set("a", "Yes");
    config.set("b", "off");
    config.set("c", true);
    ASSERT_TRUE(config.getBool("a"));
    ASSERT_FALSE(config.getBool("b", true));
    ASSERT_TRUE(config.getBool("c"));
    ASSERT_TRUE(config.getBool("d", true));
}

// ============================================================================
// RunSettings Tests
// ============================================================================

TEST(RunSettings, FromConfig) {
    Config config = minimalConfig();
    config.set("scan.sampling_rate", 50.0);
    config.set("scan.stack", "geometric");
    config.set("scan.decimate", "2, 2, 1");
    config.set("trigger.method", "dynamic");
    config.set("locate.marginal", "max");
    config.set("onset.s_components", "n, e");
    config.set("magnitude.station_corrections", "GB.ESK:0.2, GB.KESW:-0.1");
    config.set("magnitude.enabled", true);
    config.set("magnitude.amp_feature", "P_amp");
    config.set("magnitude.loc_method", "Gaussian");
    config.set("magnitude.trace_filter", ".*H[NE]$");
    config.set("magnitude.station_filter", "KVE, LIND");

    RunSettings s = RunSettings::fromConfig(config);
    ASSERT_NO_THROW(s.validate());
    ASSERT_NEAR(s.scan.sampling_rate, 50.0, 1e-12);
    ASSERT_TRUE(s.scan.stack == StackMode::GeometricMean);
    ASSERT_EQ(s.scan.decimate[0], 2);
    ASSERT_EQ(s.scan.decimate[2], 1);
    ASSERT_TRUE(s.trigger.method == ThresholdMethod::Dynamic);
    ASSERT_TRUE(s.locate.marginal == MarginalMode::Max);
    ASSERT_EQ(s.onset.phases[PhaseType::S].components.size(), 2u);
    ASSERT_EQ(s.onset.phases[PhaseType::S].components[0], 'N');
    ASSERT_NEAR(s.magnitude.station_corrections["GB.KESW"], -0.1, 1e-12);
    ASSERT_EQ(s.magnitude.amp_feature, "P_amp");
    ASSERT_EQ(s.magnitude.loc_method, "gaussian");
    ASSERT_EQ(s.magnitude.trace_filter, ".*H[NE]$");
    ASSERT_EQ(s.magnitude.station_filter.size(), 2u);
    ASSERT_EQ(s.magnitude.station_filter[1], "LIND");
    ASSERT_NEAR(s.grid.node_spacing.z, 2.0, 1e-12);
}

TEST(RunSettings, DefaultGridInvalid) {
    RunSettings s;
    ASSERT_THROW(s.validate(), ConfigError);
}

TEST(RunSettings, RejectsInvertedGrid) {
    Config config = minimalConfig();
    config.set("grid.ur_corner", "10, -20, 10");
    ASSERT_THROW(RunSettings::fromConfig(config), ConfigError);
}

TEST(RunSettings, RejectsShortLta) {
    Config config = minimalConfig();
    config.set("onset.p_sta", 1.0);
    config.set("onset.p_lta", 0.5);
    ASSERT_THROW(RunSettings::fromConfig(config), ConfigError);
}

TEST(RunSettings, RejectsFilterCorners) {
    Config config = minimalConfig();
    config.set("onset.p_corners", 12);
    ASSERT_THROW(RunSettings::fromConfig(config), ConfigError);
}

TEST(RunSettings, RejectsUnknownNames) {
    Config stack = minimalConfig();
    stack.set("scan.stack", "median");
    ASSERT_THROW(RunSettings::fromConfig(stack), ConfigError);

    Config phase = minimalConfig();
    phase.set("lut.phases", "P, Pn");
    ASSERT_THROW(RunSettings::fromConfig(phase), ConfigError);

    Config curve = minimalConfig();
    curve.set("magnitude.enabled", true);
    curve.set("magnitude.a0", "Bakun-Joyner");
    ASSERT_THROW(RunSettings::fromConfig(curve), ConfigError);

    Config feature = minimalConfig();
    feature.set("magnitude.enabled", true);
    feature.set("magnitude.amp_feature", "Coda_amp");
    ASSERT_THROW(RunSettings::fromConfig(feature), ConfigError);

    Config filter = minimalConfig();
    filter.set("magnitude.enabled", true);
    filter.set("magnitude.trace_filter", "(HH");
    ASSERT_THROW(RunSettings::fromConfig(filter), ConfigError);
}

TEST(RunSettings, RejectsFractions) {
    Config config = minimalConfig();
    config.set("locate.uncertainty_fraction", 1.0);
    ASSERT_THROW(RunSettings::fromConfig(config), ConfigError);
}

TEST(RunSettings, RejectsDecimation) {
    Config config = minimalConfig();
    config.set("scan.decimate", "1, 0, 1");
    ASSERT_THROW(RunSettings::fromConfig(config), ConfigError);

    Config partial = minimalConfig();
    partial.set("scan.decimate", "2, 2");
    ASSERT_THROW(RunSettings::fromConfig(partial), ConfigError);
}

TEST(RunSettings, LayeredNeedsFile) {
    Config config = minimalConfig();
    config.set("lut.velocity_model", "layered");
    ASSERT_THROW(RunSettings::fromConfig(config), ConfigError);
}

// ============================================================================
// Event Tests
// ============================================================================

TEST(Event, QualityFlagNames) {
    ASSERT_EQ(qualityFlagsToString(QUALITY_OK), "ok");
    ASSERT_EQ(qualityFlagsToString(QUALITY_FLAT_VOLUME | QUALITY_BOUNDARY_Z),
              "flat_volume|boundary_z");
}

TEST(Event, PickStatusNames) {
    ASSERT_EQ(pickStatusToString(PickStatus::Ok), "ok");
    ASSERT_EQ(pickStatusToString(PickStatus::NoPeak), "no_peak");
    ASSERT_EQ(pickStatusToString(PickStatus::OutsideWindow), "outside_window");
}

TEST(Event, ValidPickCount) {
    Event event;
    Pick good;
    good.valid = true;
    good.status = PickStatus::Ok;
    Pick bad;
    event.picks = {good, bad, good};
    ASSERT_EQ(event.validPickCount(), 2);

    std::string summary = event.summary();
    ASSERT_TRUE(summary.find("Picks: 2/3 valid") != std::string::npos);
}
