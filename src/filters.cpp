#include "filters.hpp"

#include "math_utils.hpp"

#include <cmath>
#include <stdexcept>

namespace acti {

namespace {

Biquad designSecondOrder(FilterType type, double fs, double f0, double q) {
    const double w0 = 2.0 * kPi * f0 / fs;
    const double alpha = std::sin(w0) / (2.0 * q);
    const double cosw0 = std::cos(w0);

    double b0 = 0.0;
    double b1 = 0.0;
    double b2 = 0.0;
    if (type == FilterType::LowPass) {
        b0 = (1.0 - cosw0) / 2.0;
        b1 = 1.0 - cosw0;
        b2 = (1.0 - cosw0) / 2.0;
    } else {
        b0 = (1.0 + cosw0) / 2.0;
        b1 = -(1.0 + cosw0);
        b2 = (1.0 + cosw0) / 2.0;
    }
    double a0 = 1.0 + alpha;
    double a1 = -2.0 * cosw0;
    double a2 = 1.0 - alpha;

    Biquad bi;
    bi.b0 = b0 / a0;
    bi.b1 = b1 / a0;
    bi.b2 = b2 / a0;
    bi.a1 = a1 / a0;
    bi.a2 = a2 / a0;
    return bi;
}

Biquad designFirstOrder(FilterType type, double fs, double f0) {
    const double k = std::tan(kPi * f0 / fs);
    Biquad bi;
    if (type == FilterType::LowPass) {
        bi.b0 = k / (1.0 + k);
        bi.b1 = bi.b0;
    } else {
        bi.b0 = 1.0 / (1.0 + k);
        bi.b1 = -bi.b0;
    }
    bi.b2 = 0.0;
    bi.a1 = (k - 1.0) / (k + 1.0);
    bi.a2 = 0.0;
    return bi;
}

}  // namespace

ButterworthFilter::ButterworthFilter(FilterType type, double sampleRate, double cutoffHz, int order) {
    if (sampleRate <= 0.0 || cutoffHz <= 0.0 || cutoffHz >= sampleRate / 2.0) {
        throw std::invalid_argument("Cutoff must lie strictly between 0 and the Nyquist frequency");
    }
    if (order < 1) {
        throw std::invalid_argument("Filter order must be at least 1");
    }
    for (int k = 1; k <= order / 2; ++k) {
        double q = 1.0 / (2.0 * std::cos((2.0 * k - 1.0) * kPi / (2.0 * order)));
        sections_.push_back(designSecondOrder(type, sampleRate, cutoffHz, q));
    }
    if (order % 2 == 1) {
        sections_.push_back(designFirstOrder(type, sampleRate, cutoffHz));
    }
}

std::vector<double> ButterworthFilter::apply(const std::vector<double>& input) const {
    std::vector<double> out = input;
    for (Biquad section : sections_) {
        section.reset();
        for (double& v : out) {
            v = section.process(v);
        }
    }
    return out;
}

std::vector<double> lowPass(const std::vector<double>& input, double sampleRate, double cutoffHz, int order) {
    return ButterworthFilter(FilterType::LowPass, sampleRate, cutoffHz, order).apply(input);
}

std::vector<double> highPass(const std::vector<double>& input, double sampleRate, double cutoffHz, int order) {
    return ButterworthFilter(FilterType::HighPass, sampleRate, cutoffHz, order).apply(input);
}

std::vector<double> bandPass(const std::vector<double>& input, double sampleRate,
                             double lowCutoffHz, double highCutoffHz, int order) {
    if (lowCutoffHz >= highCutoffHz) {
        throw std::invalid_argument("Band-pass low cutoff must be below the high cutoff");
    }
    return lowPass(highPass(input, sampleRate, lowCutoffHz, order), sampleRate, highCutoffHz, order);
}

}  // namespace acti
