#pragma once

#include "types.hpp"
#include <cmath>
#include <map>
#include <memory>

namespace quakemigrate {

/**
 * Waveform - One continuous channel segment on a fixed sample grid
 *
 * Missing samples are NaN. Statistics skip them; fillGaps() replaces them
 * before any filtering.
 */
class Waveform {
public:
    Waveform() : sample_rate_(0) {}

    Waveform(const StreamID& id, double sample_rate, TimePoint start_time)
        : stream_id_(id), sample_rate_(sample_rate), start_time_(start_time) {}

    const StreamID& streamId() const { return stream_id_; }
    double sampleRate() const { return sample_rate_; }
    TimePoint startTime() const { return start_time_; }
    TimePoint endTime() const {
        return data_.empty() ? start_time_ : timeAt(data_.size() - 1);
    }
    size_t sampleCount() const { return data_.size(); }

    const SampleVector& data() const { return data_; }
    SampleVector& data() { return data_; }
    Sample operator[](size_t idx) const { return data_[idx]; }

    void append(Sample s) { data_.push_back(s); }
    void append(const SampleVector& samples) {
        data_.insert(data_.end(), samples.begin(), samples.end());
    }

    // Index of the sample at or before t (may be negative or past the end)
    int64_t indexAt(TimePoint t) const {
        return static_cast<int64_t>(
            std::floor(secondsBetween(start_time_, t) * sample_rate_ + 1e-9));
    }

    TimePoint timeAt(size_t idx) const {
        return addSeconds(start_time_, idx / sample_rate_);
    }

    bool isMissing(size_t idx) const { return std::isnan(data_[idx]); }
    size_t gapCount() const;

    // Mean of the present samples among the first `count`
    Sample mean(size_t count) const;
    Sample mean() const { return mean(data_.size()); }

    // Removes the mean of the first `count` samples from the whole segment
    void demean(size_t count);
    void demean() { demean(data_.size()); }

    // Least-squares line through the present samples
    void detrend();

    // Cosine taper over `fraction` of the segment at each end
    void taper(double fraction);

    // Replaces NaN samples; returns how many were replaced
    size_t fillGaps(Sample value);

    // Combines another segment of the same stream into this one. Samples
    // between the two are NaN; where they overlap this waveform wins.
    // Returns false if the sample rates differ.
    bool merge(const Waveform& other);

    // Samples whose time lies in [start, end]
    Waveform slice(TimePoint start, TimePoint end) const;

private:
    StreamID stream_id_;
    double sample_rate_;
    TimePoint start_time_;
    SampleVector data_;
};

using WaveformPtr = std::shared_ptr<Waveform>;
using WaveformMap = std::map<StreamID, WaveformPtr>;

} // namespace quakemigrate
