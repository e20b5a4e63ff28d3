#include "quakemigrate/onset/filter.hpp"
#include "quakemigrate/core/exception.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>

namespace quakemigrate {

namespace {

void checkCutoff(double cutoff, double sample_rate) {
    if (!(cutoff > 0) || !(cutoff < sample_rate / 2.0)) {
        std::ostringstream msg;
        msg << "filter: corner frequency " << cutoff << " Hz must lie in (0, "
            << sample_rate / 2.0 << ") Hz for sampling rate " << sample_rate << " Hz";
        throw ConfigError(msg.str());
    }
}

// Q of the k-th pole pair of an order-n Butterworth prototype
double poleQ(int k, int order) {
    return 1.0 / (2.0 * std::sin((2.0 * k + 1) * M_PI / (2.0 * order)));
}

} // anonymous namespace

void IIRFilter::addLowpass(IIRFilter& f, int order, double cutoff, double sample_rate) {
    checkCutoff(cutoff, sample_rate);
    double K = std::tan(M_PI * cutoff / sample_rate);
    double K2 = K * K;

    for (int k = 0; k < order / 2; k++) {
        double Q = poleQ(k, order);
        double norm = 1.0 / (1.0 + K / Q + K2);
        Section s;
        s.b0 = K2 * norm;
        s.b1 = 2.0 * s.b0;
        s.b2 = s.b0;
        s.a1 = 2.0 * (K2 - 1.0) * norm;
        s.a2 = (1.0 - K / Q + K2) * norm;
        f.sections_.push_back(s);
    }
    if (order % 2 == 1) {
        double norm = 1.0 / (1.0 + K);
        Section s;
        s.b0 = K * norm;
        s.b1 = s.b0;
        s.b2 = 0;
        s.a1 = (K - 1.0) * norm;
        s.a2 = 0;
        f.sections_.push_back(s);
    }
}

void IIRFilter::addHighpass(IIRFilter& f, int order, double cutoff, double sample_rate) {
    checkCutoff(cutoff, sample_rate);
    double K = std::tan(M_PI * cutoff / sample_rate);
    double K2 = K * K;

    for (int k = 0; k < order / 2; k++) {
        double Q = poleQ(k, order);
        double norm = 1.0 / (1.0 + K / Q + K2);
        Section s;
        s.b0 = norm;
        s.b1 = -2.0 * norm;
        s.b2 = norm;
        s.a1 = 2.0 * (K2 - 1.0) * norm;
        s.a2 = (1.0 - K / Q + K2) * norm;
        f.sections_.push_back(s);
    }
    if (order % 2 == 1) {
        double norm = 1.0 / (1.0 + K);
        Section s;
        s.b0 = norm;
        s.b1 = -norm;
        s.b2 = 0;
        s.a1 = (K - 1.0) * norm;
        s.a2 = 0;
        f.sections_.push_back(s);
    }
}

IIRFilter IIRFilter::butterworth(int order, double low_freq, double high_freq,
                                 double sample_rate) {
    if (order < 1) throw ConfigError("filter: order must be >= 1");
    if (!(low_freq < high_freq)) {
        throw ConfigError("filter: band-pass low corner must be below the high corner");
    }
    IIRFilter filter;
    addHighpass(filter, order, low_freq, sample_rate);
    addLowpass(filter, order, high_freq, sample_rate);
    return filter;
}

IIRFilter IIRFilter::butterworthLowpass(int order, double cutoff, double sample_rate) {
    if (order < 1) throw ConfigError("filter: order must be >= 1");
    IIRFilter filter;
    addLowpass(filter, order, cutoff, sample_rate);
    return filter;
}

IIRFilter IIRFilter::butterworthHighpass(int order, double cutoff, double sample_rate) {
    if (order < 1) throw ConfigError("filter: order must be >= 1");
    IIRFilter filter;
    addHighpass(filter, order, cutoff, sample_rate);
    return filter;
}

void IIRFilter::apply(SampleVector& data) const {
    for (const auto& s : sections_) {
        // Direct Form II transposed
        double z1 = 0, z2 = 0;
        for (auto& x : data) {
            double y = s.b0 * x + z1;
            z1 = s.b1 * x - s.a1 * y + z2;
            z2 = s.b2 * x - s.a2 * y;
            x = y;
        }
    }
}

SampleVector IIRFilter::filter(const SampleVector& data) const {
    SampleVector output = data;
    apply(output);
    return output;
}

SampleVector IIRFilter::filtfilt(const SampleVector& data) const {
    SampleVector output = data;
    apply(output);
    std::reverse(output.begin(), output.end());
    apply(output);
    std::reverse(output.begin(), output.end());
    return output;
}

} // namespace quakemigrate
