/**
 * End-to-end tests of the detect, trigger and locate stages
 *
 * A synthetic event is recorded by four three-component stations around
 * the grid; P energy arrives on the vertical, S energy on the horizontals.
 */

#include "test_framework.hpp"
#include "quakemigrate/core/archive.hpp"
#include "quakemigrate/core/exception.hpp"
#include "quakemigrate/core/time_util.hpp"
#include "quakemigrate/pipeline/quake_scan.hpp"
#include <cmath>
#include <filesystem>
#include <random>

using namespace quakemigrate;
using namespace quakemigrate::test;
namespace fs = std::filesystem;

namespace {

const double kRate = 50.0;
const double kDuration = 60.0;
const double kVp = 5.0;
const double kVs = 2.9;

TimePoint t0() {
    TimePoint t;
    parseTime("2021-03-04T23:59:30", t);
    return t;
}

TimePoint originTime() { return addSeconds(t0(), 25.0); }

Point3 source() { return Point3(2, -4, 6); }

StationInventory squareNetwork() {
    StationInventory inventory;
    const char* codes[] = {"SW", "SE", "NW", "NE"};
    const double xs[] = {-8, 8, -8, 8};
    const double ys[] = {-8, -8, 8, 8};
    for (int i = 0; i < 4; i++) {
        auto sta = std::make_shared<Station>("XX", codes[i], 0.0, 0.0);
        sta->setPosition(Point3(xs[i], ys[i], 0));
        inventory.addStation(sta);
    }
    return inventory;
}

// Decaying 8 Hz wavelet
double wavelet(double t) {
    if (t < 0 || t > 1.0) return 0.0;
    return 60.0 * std::sin(2 * M_PI * 8.0 * t) * std::exp(-t / 0.1);
}

std::shared_ptr<MemoryArchive> syntheticArchive(const StationInventory& inventory) {
    std::mt19937 gen(42);
    std::normal_distribution<double> noise(0.0, 1.0);

    auto archive = std::make_shared<MemoryArchive>();
    const double origin = secondsBetween(t0(), originTime());
    const size_t n = static_cast<size_t>(kDuration * kRate);

    for (const auto& [key, sta] : inventory.stations()) {
        double distance = sta->position().distanceTo(source());
        double tp = origin + distance / kVp;
        double ts = origin + distance / kVs;

        for (const char* channel : {"HHZ", "HHN", "HHE"}) {
            bool vertical = channel[2] == 'Z';
            auto wf = std::make_shared<Waveform>(sta->streamId("", channel), kRate, t0());
            for (size_t i = 0; i < n; i++) {
                double t = i / kRate;
                double v = noise(gen);
                v += vertical ? wavelet(t - tp) : wavelet(t - ts);
                wf->append(v);
            }
            archive->add(wf);
        }
    }
    return archive;
}

RunSettings integrationSettings(const std::string& directory) {
    RunSettings settings;
    settings.grid.ll_corner = Point3(-10, -10, 0);
    settings.grid.ur_corner = Point3(10, 10, 10);
    settings.grid.node_spacing = Point3(2, 2, 2);
    settings.lut.velocity_model = "homogeneous";
    settings.lut.vp = kVp;
    settings.lut.vs = kVs;

    for (PhaseType phase : {PhaseType::P, PhaseType::S}) {
        settings.onset.phases[phase].sta = 0.2;
        settings.onset.phases[phase].lta = 2.0;
    }

    settings.scan.sampling_rate = 10.0;
    settings.scan.threads = 2;
    settings.scan.timestep = 20.0;

    settings.trigger.method = ThresholdMethod::Static;
    settings.trigger.threshold = 4.0;

    settings.locate.sampling_rate = 10.0;
    settings.locate.marginal = MarginalMode::Max;
    settings.locate.marginal_window = 2.0;

    settings.magnitude.enabled = true;

    settings.output.directory = directory;
    settings.output.run_name = "integration";
    settings.output.database = directory + "/catalog.db";
    settings.output.verbose = false;
    return settings;
}

} // namespace

TEST(Integration, DetectTriggerLocate) {
    const std::string dir = scratchPath("pipeline");
    fs::remove_all(dir);

    StationInventory inventory = squareNetwork();
    RunSettings settings = integrationSettings(dir);
    QuakeScan scan(settings, inventory, syntheticArchive(inventory));
    scan.setLut(scan.buildLut());
    ASSERT_EQ(scan.lut()->stationCount(), 4u);

    TimePoint start = addSeconds(t0(), 5.0);
    TimePoint end = addSeconds(t0(), 50.0);

    // Three chunks of 20 s, 20 s and 5 s
    CoalescenceSeries series = scan.detect(start, end);
    ASSERT_EQ(series.size(), 450u);
    ASSERT_TRUE(series.samples().front().time == start);
    ASSERT_TRUE(fs::exists(scan.output().coalescencePath(start)));
    ASSERT_TRUE(fs::exists(scan.output().coalescencePath(end)));

    // Everything is already stored
    ASSERT_EQ(scan.detect(start, end).size(), 0u);

    std::vector<Trigger> triggers = scan.trigger(start, end);
    ASSERT_GE(triggers.size(), 1u);

    std::vector<Event> events = scan.locate(start, end);
    ASSERT_EQ(events.size(), triggers.size());

    size_t best = 0;
    for (size_t i = 1; i < events.size(); i++) {
        if (events[i].coa_value > events[best].coa_value) best = i;
    }
    const Event& event = events[best];

    // Within one scan tick
    ASSERT_NEAR(secondsBetween(originTime(), event.origin_time), 0.0,
                1.0 / settings.scan.sampling_rate + 1e-9);
    Point3 node = scan.lut()->grid().nodePosition(event.peak_node);
    ASSERT_NEAR(node.x, source().x, 2.0);
    ASSERT_NEAR(node.y, source().y, 2.0);
    ASSERT_NEAR(node.z, source().z, 2.0);
    ASSERT_TRUE(event.spline.valid);
    ASSERT_NEAR(event.spline.position.x, source().x, 2.0);
    ASSERT_NEAR(event.spline.position.y, source().y, 2.0);
    ASSERT_NEAR(event.spline.position.z, source().z, 2.0);
    ASSERT_EQ(event.contributors, 8);

    // One pick per station and phase, each above the detection ratio
    ASSERT_EQ(event.picks.size(), 8u);
    for (const auto& pick : event.picks) {
        ASSERT_TRUE(pick.valid);
        ASSERT_GT(pick.snr, settings.trigger.threshold);
        auto sta = inventory.getStation(pick.station);
        ASSERT_TRUE(sta != nullptr);
        double v = pick.phase == PhaseType::P ? kVp : kVs;
        double arrival = 25.0 + sta->position().distanceTo(source()) / v;
        ASSERT_NEAR(secondsBetween(t0(), pick.time), arrival, 0.25);
    }
    ASSERT_TRUE(event.magnitude.has_value());

    ASSERT_TRUE(fs::exists(scan.output().eventPath(event.uid)));
    ASSERT_TRUE(fs::exists(scan.output().pickPath(event.uid)));

    CatalogDatabase db;
    ASSERT_TRUE(db.open(settings.output.database));
    ASSERT_EQ(db.countEvents(), static_cast<int64_t>(events.size()));
    ASSERT_EQ(db.countTriggers(), static_cast<int64_t>(triggers.size()));
    ASSERT_EQ(db.countPicks(), static_cast<int64_t>(8 * events.size()));
    db.close();

    fs::remove_all(dir);
}

TEST(Integration, StopBeforeDetect) {
    const std::string dir = scratchPath("stopped");
    fs::remove_all(dir);

    StationInventory inventory = squareNetwork();
    RunSettings settings = integrationSettings(dir);
    settings.output.database.clear();
    QuakeScan scan(settings, inventory, syntheticArchive(inventory));
    scan.setLut(scan.buildLut());

    scan.requestStop();
    ASSERT_TRUE(scan.stopRequested());
    CoalescenceSeries series = scan.detect(addSeconds(t0(), 5.0), addSeconds(t0(), 50.0));
    ASSERT_EQ(series.size(), 0u);

    fs::remove_all(dir);
}

TEST(Integration, DetectWithoutLut) {
    const std::string dir = scratchPath("nolut");
    StationInventory inventory = squareNetwork();
    RunSettings settings = integrationSettings(dir);
    settings.output.database.clear();
    QuakeScan scan(settings, inventory, std::make_shared<MemoryArchive>());
    ASSERT_THROW(scan.detect(t0(), addSeconds(t0(), 10.0)), Exception);
    fs::remove_all(dir);
}
