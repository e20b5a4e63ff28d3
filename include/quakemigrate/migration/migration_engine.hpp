#pragma once

#include "coalescence.hpp"
#include "worker_pool.hpp"
#include "quakemigrate/lut/lookup_table.hpp"
#include "quakemigrate/onset/onset.hpp"
#include <atomic>

namespace quakemigrate {

struct MigrationOptions {
    double sampling_rate;       // ticks per second
    StackMode stack;
    bool normalise;             // Sum mode: divide by the contributor count
    size_t threads;
    size_t block_size;          // nodes per work block
    double max_volume_mb;       // limit of a retained volume

    MigrationOptions()
        : sampling_rate(20.0)
        , stack(StackMode::Sum)
        , normalise(true)
        , threads(1)
        , block_size(4096)
        , max_volume_mb(2048.0) {}
};

/**
 * MigrationEngine - Back-projects onset functions through the lookup table
 * and stacks them at every grid node, one origin-time tick at a time
 *
 * For a tick t and node n each station/phase pair contributes its onset at
 * t + tt(station, phase, n), interpolated linearly between samples. Pairs
 * whose shifted time falls outside the onset, or on an unavailable sample,
 * are left out of that node's stack.
 *
 * Nodes are split into fixed blocks; workers own contiguous runs of blocks
 * and the per-block maxima and sums are reduced in block order, so the
 * result does not depend on the number of threads.
 */
class MigrationEngine {
public:
    MigrationEngine(LookupTablePtr lut, const MigrationOptions& options);

    // Appends one sample per tick in [start, end) to series, or per tick
    // after the last sample of a non-empty series. When volume is given it
    // is allocated and filled with every node's stack. Returns the number of
    // ticks appended; fewer than requested only after requestStop().
    size_t run(const OnsetData& onsets, TimePoint start, TimePoint end,
               CoalescenceSeries& series, CoalescenceVolume* volume = nullptr);

    // Honoured before the next tick; thread-safe
    void requestStop() { stop_.store(true); }
    void resetStop() { stop_.store(false); }
    bool stopRequested() const { return stop_.load(); }

    const MigrationOptions& options() const { return options_; }
    const LookupTable& lut() const { return *lut_; }

    // Number of ticks start + k / rate lying before end
    static size_t tickCount(TimePoint start, TimePoint end, double sampling_rate);

private:
    struct BlockResult {
        double max;
        size_t argmax;
        size_t contributors;
        double sum;
    };

    struct PairView {
        const OnsetTrace* trace;
        const std::vector<double>* traveltimes;
    };

    LookupTablePtr lut_;
    MigrationOptions options_;
    WorkerPool pool_;
    std::atomic<bool> stop_;

    void stackBlock(const std::vector<PairView>& pairs, TimePoint tick,
                    size_t first, size_t last,
                    std::vector<double>& acc, std::vector<size_t>& count,
                    double* volume_row, BlockResult& result) const;
};

} // namespace quakemigrate
