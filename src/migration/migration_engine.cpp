#include "quakemigrate/migration/migration_engine.hpp"
#include "quakemigrate/core/exception.hpp"
#include <algorithm>
#include <cmath>

namespace quakemigrate {

MigrationEngine::MigrationEngine(LookupTablePtr lut, const MigrationOptions& options)
    : lut_(std::move(lut))
    , options_(options)
    , pool_(options.threads)
    , stop_(false)
{
    if (!lut_ || lut_->empty()) {
        throw ConfigError("migration: lookup table is empty");
    }
    if (options_.threads < 1) {
        throw ConfigError("migration: thread count must be >= 1");
    }
    if (!(options_.sampling_rate > 0)) {
        throw ConfigError("migration: sampling rate must be positive");
    }
    if (options_.block_size < 1) options_.block_size = 1;
}

size_t MigrationEngine::tickCount(TimePoint start, TimePoint end, double sampling_rate) {
    double span = secondsBetween(start, end);
    if (span <= 0) return 0;
    return static_cast<size_t>(std::ceil(span * sampling_rate - 1e-9));
}

void MigrationEngine::stackBlock(const std::vector<PairView>& pairs, TimePoint tick,
                                 size_t first, size_t last,
                                 std::vector<double>& acc, std::vector<size_t>& count,
                                 double* volume_row, BlockResult& result) const {
    const size_t len = last - first;
    std::fill(acc.begin(), acc.begin() + len, 0.0);
    std::fill(count.begin(), count.begin() + len, 0);
    const bool geometric = options_.stack == StackMode::GeometricMean;

    for (const auto& pair : pairs) {
        const OnsetTrace& trace = *pair.trace;
        const std::vector<double>& tt = *pair.traveltimes;
        const double rate = trace.sample_rate;
        const double base = secondsBetween(trace.start_time, tick) * rate;
        const double last_index = static_cast<double>(trace.size() - 1);

        for (size_t n = first; n < last; n++) {
            double pos = base + tt[n] * rate;
            if (pos < 0 || pos > last_index) continue;
            size_t i0 = static_cast<size_t>(pos);
            double frac = pos - i0;
            if (!trace.available[i0]) continue;
            double v = trace.values[i0];
            if (frac > 0 && i0 + 1 < trace.size()) {
                if (!trace.available[i0 + 1]) continue;
                v += frac * (trace.values[i0 + 1] - v);
            }
            acc[n - first] += geometric ? std::log1p(v) : v;
            count[n - first]++;
        }
    }

    result.max = -1.0;
    result.argmax = first;
    result.contributors = 0;
    result.sum = 0;
    for (size_t i = 0; i < len; i++) {
        double value = 0;
        if (count[i] > 0) {
            if (geometric) {
                value = std::expm1(acc[i] / count[i]);
            } else {
                value = options_.normalise ? acc[i] / count[i] : acc[i];
            }
        }
        if (volume_row) volume_row[first + i] = value;
        result.sum += value;
        if (value > result.max) {
            result.max = value;
            result.argmax = first + i;
            result.contributors = count[i];
        }
    }
}

size_t MigrationEngine::run(const OnsetData& onsets, TimePoint start, TimePoint end,
                            CoalescenceSeries& series, CoalescenceVolume* volume) {
    if (onsets.stationCount() != lut_->stationCount() ||
        onsets.phaseCount() != lut_->phaseCount()) {
        throw ConfigError("migration: onset data does not match the lookup table");
    }

    const double dt = 1.0 / options_.sampling_rate;
    if (!series.empty() && series.back().time >= start) {
        start = addSeconds(series.back().time, dt);
    }
    const size_t ticks = tickCount(start, end, options_.sampling_rate);
    const Grid3D& grid = lut_->grid();
    const size_t nodes = grid.nodeTotal();

    if (volume) {
        volume->allocate(ticks, nodes, start, options_.sampling_rate, options_.max_volume_mb);
    }
    if (ticks == 0) return 0;

    std::vector<PairView> pairs;
    for (size_t s = 0; s < lut_->stationCount(); s++) {
        for (size_t p = 0; p < lut_->phaseCount(); p++) {
            const OnsetTrace& trace = onsets.trace(s, p);
            if (trace.empty() || !(trace.sample_rate > 0)) continue;
            pairs.push_back({&trace, &lut_->traveltimes(s, p)});
        }
    }

    const size_t block = options_.block_size;
    const size_t nblocks = (nodes + block - 1) / block;
    const size_t workers = pool_.size();
    std::vector<BlockResult> blocks(nblocks);
    std::vector<std::vector<double>> acc(workers, std::vector<double>(block));
    std::vector<std::vector<size_t>> count(workers, std::vector<size_t>(block));

    size_t appended = 0;
    for (size_t k = 0; k < ticks; k++) {
        if (stop_.load()) break;

        TimePoint tick = addSeconds(start, k * dt);
        double* row = volume ? volume->tick(k) : nullptr;

        pool_.run([&](size_t w) {
            size_t b_first = w * nblocks / workers;
            size_t b_last = (w + 1) * nblocks / workers;
            for (size_t b = b_first; b < b_last; b++) {
                size_t first = b * block;
                size_t last = std::min(first + block, nodes);
                stackBlock(pairs, tick, first, last, acc[w], count[w], row, blocks[b]);
            }
        });

        CoalescenceSample sample;
        sample.time = tick;
        double best = -1.0;
        double total = 0;
        for (const auto& r : blocks) {
            total += r.sum;
            if (r.max > best) {
                best = r.max;
                sample.node = r.argmax;
                sample.contributors = r.contributors;
            }
        }
        sample.value = std::max(best, 0.0);
        double mean = total / nodes;
        sample.normalised = mean > 0 ? sample.value / mean : 0.0;
        sample.position = grid.nodePosition(sample.node);

        if (!series.append(sample)) {
            throw ConfigError("migration: tick times must increase");
        }
        appended++;
        if (volume) volume->setFilledTicks(appended);
    }
    return appended;
}

} // namespace quakemigrate
