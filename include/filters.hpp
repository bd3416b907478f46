#pragma once

#include <vector>

namespace acti {

// Direct form II transposed second-order section (RBJ cookbook coefficients).
struct Biquad {
    double b0{1.0}, b1{0.0}, b2{0.0}, a1{0.0}, a2{0.0};
    double z1{0.0}, z2{0.0};

    double process(double in) {
        double out = in * b0 + z1;
        z1 = in * b1 + z2 - a1 * out;
        z2 = in * b2 - a2 * out;
        return out;
    }

    void reset() {
        z1 = 0.0;
        z2 = 0.0;
    }
};

enum class FilterType {
    LowPass,
    HighPass
};

// Butterworth filter of arbitrary order built from cascaded sections.
class ButterworthFilter {
public:
    ButterworthFilter(FilterType type, double sampleRate, double cutoffHz, int order);

    std::vector<double> apply(const std::vector<double>& input) const;

    const std::vector<Biquad>& sections() const { return sections_; }

private:
    std::vector<Biquad> sections_;
};

std::vector<double> lowPass(const std::vector<double>& input, double sampleRate, double cutoffHz, int order);
std::vector<double> highPass(const std::vector<double>& input, double sampleRate, double cutoffHz, int order);
std::vector<double> bandPass(const std::vector<double>& input, double sampleRate,
                             double lowCutoffHz, double highCutoffHz, int order);

}  // namespace acti
