/**
 * Unit tests for the migration engine, coalescence containers and worker pool
 */

#include "test_framework.hpp"
#include "quakemigrate/core/exception.hpp"
#include "quakemigrate/core/time_util.hpp"
#include "quakemigrate/migration/migration_engine.hpp"
#include <atomic>
#include <cmath>
#include <stdexcept>

using namespace quakemigrate;
using namespace quakemigrate::test;

namespace {

TimePoint t0() {
    TimePoint t;
    parseTime("2021-03-04T00:00:00", t);
    return t;
}

LookupTablePtr cornerLut() {
    auto lut = std::make_shared<LookupTable>();
    HomogeneousVelocityModel model(5.0, 3.0);
    lut->build(Grid3D(Point3(0, 0, 0), Point3(8, 8, 4), Point3(2, 2, 2)),
               {LutStation("XX.A", Point3(0, 0, 0)), LutStation("XX.B", Point3(8, 0, 0)),
                LutStation("XX.C", Point3(0, 8, 0)), LutStation("XX.D", Point3(8, 8, 0))},
               {PhaseType::P, PhaseType::S}, model);
    return lut;
}

// Gaussian pulses arriving at origin + tt(source) on every pair
OnsetData pulseOnsets(const LookupTable& lut, size_t source, TimePoint origin) {
    const double rate = 100.0;
    const double width = 0.1;
    OnsetData data(lut.stationCount(), lut.phaseCount());
    for (size_t s = 0; s < lut.stationCount(); s++) {
        for (size_t p = 0; p < lut.phaseCount(); p++) {
            OnsetTrace& trace = data.trace(s, p);
            trace.station = lut.stations()[s].id;
            trace.phase = lut.phases()[p];
            trace.start_time = t0();
            trace.sample_rate = rate;
            double arrival = secondsBetween(t0(), origin) + lut.traveltime(s, p, source);
            for (size_t i = 0; i < 2000; i++) {
                double u = (i / rate - arrival) / width;
                trace.values.push_back(5.0 * std::exp(-0.5 * u * u));
                trace.available.push_back(1);
            }
        }
    }
    return data;
}

OnsetData flatOnsets(const LookupTable& lut) {
    OnsetData data(lut.stationCount(), lut.phaseCount());
    for (size_t s = 0; s < lut.stationCount(); s++) {
        for (size_t p = 0; p < lut.phaseCount(); p++) {
            OnsetTrace& trace = data.trace(s, p);
            trace.start_time = t0();
            trace.sample_rate = 100.0;
            trace.values.assign(2000, 1.0);
            trace.available.assign(2000, 1);
        }
    }
    return data;
}

MigrationOptions tickOptions(size_t threads, size_t block) {
    MigrationOptions opts;
    opts.sampling_rate = 10.0;
    opts.threads = threads;
    opts.block_size = block;
    return opts;
}

} // namespace

// ============================================================================
// CoalescenceSeries Tests
// ============================================================================

TEST(CoalescenceSeries, AppendIsStrictlyOrdered) {
    CoalescenceSeries series;
    CoalescenceSample s;
    s.time = t0();
    ASSERT_TRUE(series.append(s));
    ASSERT_FALSE(series.append(s));
    s.time = addSeconds(t0(), -1.0);
    ASSERT_FALSE(series.append(s));
    s.time = addSeconds(t0(), 0.1);
    ASSERT_TRUE(series.append(s));
    ASSERT_EQ(series.size(), 2u);

    CoalescenceSeries cut = series.between(addSeconds(t0(), 0.05), addSeconds(t0(), 1.0));
    ASSERT_EQ(cut.size(), 1u);
    ASSERT_TRUE(cut[0].time == addSeconds(t0(), 0.1));
}

TEST(CoalescenceVolume, MarginaliseSumAndMax) {
    CoalescenceVolume volume;
    volume.allocate(3, 2, t0(), 10.0, 16.0);
    const double rows[3][2] = {{1, 4}, {3, 2}, {2, 1}};
    for (size_t t = 0; t < 3; t++) {
        volume.tick(t)[0] = rows[t][0];
        volume.tick(t)[1] = rows[t][1];
    }
    volume.setFilledTicks(3);

    std::vector<double> sum = volume.marginalise(MarginalMode::Sum);
    std::vector<double> max = volume.marginalise(MarginalMode::Max);
    ASSERT_NEAR(sum[0], 6.0, 1e-12);
    ASSERT_NEAR(sum[1], 7.0, 1e-12);
    ASSERT_NEAR(max[0], 3.0, 1e-12);
    ASSERT_NEAR(max[1], 4.0, 1e-12);

    std::vector<double> node = volume.nodeSeries(1);
    ASSERT_EQ(node.size(), 3u);
    ASSERT_NEAR(node[2], 1.0, 1e-12);
    ASSERT_TRUE(volume.timeAt(2) == addSeconds(t0(), 0.2));
}

TEST(CoalescenceVolume, MemoryLimit) {
    CoalescenceVolume volume;
    ASSERT_THROW(volume.allocate(1000, 100000, t0(), 10.0, 1.0), ResourceError);
}

// ============================================================================
// WorkerPool Tests
// ============================================================================

TEST(WorkerPool, RunsEveryWorker) {
    WorkerPool pool(4);
    std::atomic<int> mask(0);
    for (int round = 0; round < 10; round++) {
        mask.store(0);
        pool.run([&](size_t w) { mask.fetch_or(1 << w); });
        ASSERT_EQ(mask.load(), 15);
    }
}

TEST(WorkerPool, RethrowsWorkerException) {
    WorkerPool pool(3);
    std::atomic<int> finished(0);
    auto task = [&](size_t w) {
        finished++;
        if (w == 2) throw std::runtime_error("worker failed");
    };
    ASSERT_THROW(pool.run(task), std::runtime_error);
    ASSERT_EQ(finished.load(), 3);

    // Still usable afterwards
    finished.store(0);
    pool.run([&](size_t) { finished++; });
    ASSERT_EQ(finished.load(), 3);
}

TEST(WorkerPool, RethrowsNonStandardException) {
    WorkerPool pool(2);
    ASSERT_THROW(pool.run([](size_t w) { if (w == 1) throw 42; }), int);

    std::atomic<int> finished(0);
    pool.run([&](size_t) { finished++; });
    ASSERT_EQ(finished.load(), 2);
}

// ============================================================================
// MigrationEngine Tests
// ============================================================================

TEST(MigrationEngine, TickCount) {
    ASSERT_EQ(MigrationEngine::tickCount(t0(), addSeconds(t0(), 1.0), 10.0), 10u);
    ASSERT_EQ(MigrationEngine::tickCount(t0(), addSeconds(t0(), 1.05), 10.0), 11u);
    ASSERT_EQ(MigrationEngine::tickCount(t0(), t0(), 10.0), 0u);
    ASSERT_EQ(MigrationEngine::tickCount(addSeconds(t0(), 1.0), t0(), 10.0), 0u);
}

TEST(MigrationEngine, RejectsBadOptions) {
    LookupTablePtr lut = cornerLut();
    ASSERT_THROW(MigrationEngine(lut, tickOptions(0, 16)), ConfigError);
    ASSERT_THROW(MigrationEngine(std::make_shared<LookupTable>(), tickOptions(1, 16)),
                 ConfigError);
}

TEST(MigrationEngine, FindsSource) {
    LookupTablePtr lut = cornerLut();
    const size_t source = lut->grid().nearestNode(Point3(4, 4, 2));
    const TimePoint origin = addSeconds(t0(), 5.0);
    OnsetData onsets = pulseOnsets(*lut, source, origin);

    MigrationEngine engine(lut, tickOptions(1, 4096));
    CoalescenceSeries series;
    size_t n = engine.run(onsets, addSeconds(t0(), 2.0), addSeconds(t0(), 8.0), series);
    ASSERT_EQ(n, 60u);
    ASSERT_EQ(series.size(), 60u);

    size_t best = 0;
    for (size_t i = 0; i < series.size(); i++) {
        if (series[i].value > series[best].value) best = i;
    }
    ASSERT_TRUE(series[best].time == origin);
    ASSERT_EQ(series[best].node, source);
    ASSERT_EQ(series[best].contributors, 8u);
    ASSERT_NEAR(series[best].value, 5.0, 0.05);
    ASSERT_GT(series[best].normalised, 1.0);
    ASSERT_NEAR(series[best].position.z, 2.0, 1e-12);
}

TEST(MigrationEngine, GeometricMeanStack) {
    LookupTablePtr lut = cornerLut();
    const size_t source = lut->grid().nearestNode(Point3(4, 4, 2));
    const TimePoint origin = addSeconds(t0(), 5.0);
    OnsetData onsets = pulseOnsets(*lut, source, origin);

    MigrationOptions opts = tickOptions(2, 16);
    opts.stack = StackMode::GeometricMean;
    MigrationEngine engine(lut, opts);
    CoalescenceSeries series;
    engine.run(onsets, origin, addSeconds(origin, 0.1), series);
    ASSERT_EQ(series.size(), 1u);
    ASSERT_EQ(series[0].node, source);
    ASSERT_NEAR(series[0].value, 5.0, 0.05);
}

TEST(MigrationEngine, ThreadCountInvariant) {
    LookupTablePtr lut = cornerLut();
    const size_t source = lut->grid().nearestNode(Point3(2, 6, 4));
    OnsetData onsets = pulseOnsets(*lut, source, addSeconds(t0(), 4.3));

    MigrationEngine single(lut, tickOptions(1, 7));
    MigrationEngine multi(lut, tickOptions(3, 7));
    CoalescenceSeries a, b;
    single.run(onsets, addSeconds(t0(), 2.0), addSeconds(t0(), 7.0), a);
    multi.run(onsets, addSeconds(t0(), 2.0), addSeconds(t0(), 7.0), b);

    ASSERT_EQ(a.size(), b.size());
    for (size_t i = 0; i < a.size(); i++) {
        ASSERT_TRUE(a[i].time == b[i].time);
        ASSERT_EQ(a[i].value, b[i].value);
        ASSERT_EQ(a[i].normalised, b[i].normalised);
        ASSERT_EQ(a[i].node, b[i].node);
    }
}

TEST(MigrationEngine, TiesGoToLowestNode) {
    LookupTablePtr lut = cornerLut();
    OnsetData onsets = flatOnsets(*lut);

    MigrationEngine engine(lut, tickOptions(3, 7));
    CoalescenceSeries series;
    engine.run(onsets, addSeconds(t0(), 2.0), addSeconds(t0(), 3.0), series);
    ASSERT_EQ(series.size(), 10u);
    for (size_t i = 0; i < series.size(); i++) {
        ASSERT_EQ(series[i].node, 0u);
        ASSERT_NEAR(series[i].value, 1.0, 1e-12);
        ASSERT_NEAR(series[i].normalised, 1.0, 1e-12);
    }
}

TEST(MigrationEngine, UnavailableSamplesAreSkipped) {
    LookupTablePtr lut = cornerLut();
    OnsetData onsets = flatOnsets(*lut);
    // Station A carries nothing usable
    for (size_t p = 0; p < lut->phaseCount(); p++) {
        std::fill(onsets.trace(0, p).available.begin(), onsets.trace(0, p).available.end(), 0);
    }

    MigrationEngine engine(lut, tickOptions(1, 4096));
    CoalescenceSeries series;
    engine.run(onsets, addSeconds(t0(), 2.0), addSeconds(t0(), 2.5), series);
    ASSERT_EQ(series.size(), 5u);
    ASSERT_EQ(series[0].contributors, 6u);
    ASSERT_NEAR(series[0].value, 1.0, 1e-12);
}

TEST(MigrationEngine, StopAndResume) {
    LookupTablePtr lut = cornerLut();
    const size_t source = lut->grid().nearestNode(Point3(4, 4, 2));
    OnsetData onsets = pulseOnsets(*lut, source, addSeconds(t0(), 5.0));
    const TimePoint start = addSeconds(t0(), 2.0);
    const TimePoint end = addSeconds(t0(), 8.0);

    MigrationEngine engine(lut, tickOptions(2, 16));
    CoalescenceSeries full;
    engine.run(onsets, start, end, full);

    CoalescenceSeries partial;
    engine.requestStop();
    ASSERT_EQ(engine.run(onsets, start, end, partial), 0u);
    ASSERT_TRUE(partial.empty());
    engine.resetStop();

    ASSERT_EQ(engine.run(onsets, start, addSeconds(t0(), 5.0), partial), 30u);
    // Continues after the last stored tick
    ASSERT_EQ(engine.run(onsets, start, end, partial), 30u);
    ASSERT_EQ(partial.size(), full.size());
    for (size_t i = 0; i < full.size(); i++) {
        ASSERT_TRUE(partial[i].time == full[i].time);
        ASSERT_EQ(partial[i].value, full[i].value);
        ASSERT_EQ(partial[i].node, full[i].node);
    }
    ASSERT_EQ(engine.run(onsets, start, end, partial), 0u);
}

TEST(MigrationEngine, VolumeMatchesSeries) {
    LookupTablePtr lut = cornerLut();
    const size_t source = lut->grid().nearestNode(Point3(6, 2, 2));
    const TimePoint origin = addSeconds(t0(), 5.0);
    OnsetData onsets = pulseOnsets(*lut, source, origin);

    MigrationEngine engine(lut, tickOptions(2, 16));
    CoalescenceSeries series;
    CoalescenceVolume volume;
    engine.run(onsets, addSeconds(t0(), 4.0), addSeconds(t0(), 6.0), series, &volume);

    ASSERT_EQ(volume.filledTicks(), 20u);
    ASSERT_EQ(volume.nodeCount(), lut->grid().nodeTotal());
    for (size_t k = 0; k < series.size(); k++) {
        ASSERT_EQ(volume.at(k, series[k].node), series[k].value);
        ASSERT_TRUE(volume.timeAt(k) == series[k].time);
    }

    std::vector<double> marginal = volume.marginalise(MarginalMode::Max);
    size_t peak = 0;
    for (size_t n = 0; n < marginal.size(); n++) {
        if (marginal[n] > marginal[peak]) peak = n;
    }
    ASSERT_EQ(peak, source);
}

TEST(MigrationEngine, VolumeMemoryLimit) {
    LookupTablePtr lut = cornerLut();
    OnsetData onsets = flatOnsets(*lut);
    MigrationOptions opts = tickOptions(1, 4096);
    opts.max_volume_mb = 1e-6;
    MigrationEngine engine(lut, opts);
    CoalescenceSeries series;
    CoalescenceVolume volume;
    ASSERT_THROW(engine.run(onsets, addSeconds(t0(), 2.0), addSeconds(t0(), 3.0), series, &volume),
                 ResourceError);
    ASSERT_TRUE(series.empty());
}

TEST(MigrationEngine, MismatchedOnsetsRejected) {
    LookupTablePtr lut = cornerLut();
    MigrationEngine engine(lut, tickOptions(1, 4096));
    CoalescenceSeries series;
    OnsetData wrong(2, 2);
    ASSERT_THROW(engine.run(wrong, t0(), addSeconds(t0(), 1.0), series), ConfigError);
}
