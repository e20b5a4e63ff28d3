#pragma once

#include "quakemigrate/core/types.hpp"
#include "quakemigrate/core/settings.hpp"
#include <vector>

namespace quakemigrate {

// Maximum of the stacked onsets over the grid at one tick
struct CoalescenceSample {
    TimePoint time;
    double value;           // maximum stack value
    double normalised;      // value / mean stack over the grid
    size_t node;            // node holding the maximum
    Point3 position;        // its position, km
    size_t contributors;    // station/phase pairs stacked at that node

    CoalescenceSample() : value(0), normalised(0), node(0), contributors(0) {}
};

/**
 * CoalescenceSeries - Strictly time-ordered, append-only sequence of
 * coalescence samples
 */
class CoalescenceSeries {
public:
    CoalescenceSeries() = default;

    // Rejects (returns false) samples not later than the last one
    bool append(const CoalescenceSample& sample) {
        if (!samples_.empty() && !(sample.time > samples_.back().time)) return false;
        samples_.push_back(sample);
        return true;
    }

    bool empty() const { return samples_.empty(); }
    size_t size() const { return samples_.size(); }
    const CoalescenceSample& operator[](size_t idx) const { return samples_[idx]; }
    const CoalescenceSample& back() const { return samples_.back(); }
    const std::vector<CoalescenceSample>& samples() const { return samples_; }

    void clear() { samples_.clear(); }

    // Samples with time in [start, end)
    CoalescenceSeries between(TimePoint start, TimePoint end) const {
        CoalescenceSeries out;
        for (const auto& s : samples_) {
            if (s.time >= start && s.time < end) out.samples_.push_back(s);
        }
        return out;
    }

private:
    std::vector<CoalescenceSample> samples_;
};

/**
 * CoalescenceVolume - Stack value of every node at every tick of a run
 *
 * Owned by the caller and filled by the migration engine; storage is one
 * contiguous block of ticks x nodes doubles, tick-major.
 */
class CoalescenceVolume {
public:
    CoalescenceVolume() : ticks_(0), nodes_(0), filled_(0), sampling_rate_(0) {}

    // Throws ResourceError when the volume would exceed max_memory_mb
    void allocate(size_t ticks, size_t nodes, TimePoint start, double sampling_rate,
                  double max_memory_mb);

    static double requiredMegabytes(size_t ticks, size_t nodes) {
        return static_cast<double>(ticks) * nodes * sizeof(double) / (1024.0 * 1024.0);
    }

    size_t tickCount() const { return ticks_; }
    size_t nodeCount() const { return nodes_; }
    size_t filledTicks() const { return filled_; }
    void setFilledTicks(size_t n) { filled_ = n; }

    TimePoint startTime() const { return start_; }
    double samplingRate() const { return sampling_rate_; }
    TimePoint timeAt(size_t tick) const { return addSeconds(start_, tick / sampling_rate_); }

    double* tick(size_t t) { return data_.data() + t * nodes_; }
    const double* tick(size_t t) const { return data_.data() + t * nodes_; }
    double at(size_t t, size_t node) const { return data_[t * nodes_ + node]; }

    // Collapse the filled ticks to one value per node
    std::vector<double> marginalise(MarginalMode mode) const;

    // Values of one node over the filled ticks
    std::vector<double> nodeSeries(size_t node) const;

private:
    size_t ticks_;
    size_t nodes_;
    size_t filled_;
    TimePoint start_;
    double sampling_rate_;
    std::vector<double> data_;
};

} // namespace quakemigrate
