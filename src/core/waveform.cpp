#include "quakemigrate/core/waveform.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace quakemigrate {

size_t Waveform::gapCount() const {
    return static_cast<size_t>(std::count_if(data_.begin(), data_.end(),
                                             [](Sample s) { return std::isnan(s); }));
}

Sample Waveform::mean(size_t count) const {
    double sum = 0;
    size_t n = 0;
    for (size_t i = 0; i < std::min(count, data_.size()); i++) {
        if (std::isnan(data_[i])) continue;
        sum += data_[i];
        n++;
    }
    return n > 0 ? sum / n : 0.0;
}

void Waveform::demean(size_t count) {
    Sample m = mean(count);
    for (auto& s : data_) s -= m;
}

void Waveform::detrend() {
    double sx = 0, sy = 0, sxy = 0, sxx = 0;
    size_t n = 0;
    for (size_t i = 0; i < data_.size(); i++) {
        if (std::isnan(data_[i])) continue;
        double x = static_cast<double>(i);
        sx += x;
        sy += data_[i];
        sxy += x * data_[i];
        sxx += x * x;
        n++;
    }
    if (n < 2) return;
    double denom = n * sxx - sx * sx;
    if (denom == 0) return;
    double slope = (n * sxy - sx * sy) / denom;
    double intercept = (sy - slope * sx) / n;
    for (size_t i = 0; i < data_.size(); i++) {
        data_[i] -= slope * i + intercept;
    }
}

void Waveform::taper(double fraction) {
    if (data_.size() < 2 || fraction <= 0) return;
    size_t len = std::max<size_t>(1, static_cast<size_t>(data_.size() * fraction));
    len = std::min(len, data_.size() / 2);

    for (size_t i = 0; i < len; i++) {
        double w = 0.5 * (1.0 - std::cos(M_PI * i / len));
        data_[i] *= w;
        data_[data_.size() - 1 - i] *= w;
    }
}

size_t Waveform::fillGaps(Sample value) {
    size_t filled = 0;
    for (auto& s : data_) {
        if (!std::isnan(s)) continue;
        s = value;
        filled++;
    }
    return filled;
}

bool Waveform::merge(const Waveform& other) {
    if (other.data_.empty()) return true;
    if (data_.empty()) {
        *this = other;
        return true;
    }
    if (std::abs(other.sample_rate_ - sample_rate_) > 1e-6 * sample_rate_) {
        return false;
    }

    TimePoint start = std::min(start_time_, other.start_time_);
    auto offsetOf = [&](TimePoint t) {
        return static_cast<int64_t>(std::llround(secondsBetween(start, t) * sample_rate_));
    };

    int64_t this_off = offsetOf(start_time_);
    int64_t other_off = offsetOf(other.start_time_);
    int64_t total = std::max(this_off + static_cast<int64_t>(data_.size()),
                             other_off + static_cast<int64_t>(other.data_.size()));

    SampleVector merged(static_cast<size_t>(total), std::numeric_limits<double>::quiet_NaN());
    for (size_t i = 0; i < other.data_.size(); i++) {
        merged[other_off + i] = other.data_[i];
    }
    for (size_t i = 0; i < data_.size(); i++) {
        if (!std::isnan(data_[i]) || std::isnan(merged[this_off + i])) {
            merged[this_off + i] = data_[i];
        }
    }

    start_time_ = start;
    data_.swap(merged);
    return true;
}

Waveform Waveform::slice(TimePoint start, TimePoint end) const {
    int64_t first = static_cast<int64_t>(
        std::ceil(secondsBetween(start_time_, start) * sample_rate_ - 1e-9));
    int64_t last = indexAt(end) + 1;
    first = std::max<int64_t>(first, 0);
    last = std::min<int64_t>(last, static_cast<int64_t>(data_.size()));

    Waveform result(stream_id_, sample_rate_, timeAt(static_cast<size_t>(first)));
    if (first < last) {
        result.data_.assign(data_.begin() + first, data_.begin() + last);
    }
    return result;
}

} // namespace quakemigrate
