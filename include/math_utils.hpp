#pragma once

#include <algorithm>
#include <cmath>
#include <iterator>
#include <limits>
#include <numeric>
#include <ostream>
#include <vector>

namespace acti {

constexpr double kPi = 3.14159265358979323846;
constexpr double kRadToDeg = 180.0 / kPi;

struct Vec3 {
    double x{0.0};
    double y{0.0};
    double z{0.0};

    Vec3() = default;
    Vec3(double x_, double y_, double z_) : x(x_), y(y_), z(z_) {}

    Vec3& operator+=(const Vec3& rhs) {
        x += rhs.x;
        y += rhs.y;
        z += rhs.z;
        return *this;
    }

    Vec3& operator*=(double s) {
        x *= s;
        y *= s;
        z *= s;
        return *this;
    }

    Vec3& operator/=(double s) {
        x /= s;
        y /= s;
        z /= s;
        return *this;
    }
};

inline Vec3 operator+(Vec3 lhs, const Vec3& rhs) {
    lhs += rhs;
    return lhs;
}

inline Vec3 operator*(Vec3 v, double s) {
    v *= s;
    return v;
}

inline Vec3 operator/(Vec3 v, double s) {
    v /= s;
    return v;
}

// Per-axis product, used for scale vectors.
inline Vec3 hadamard(const Vec3& a, const Vec3& b) {
    return Vec3{a.x * b.x, a.y * b.y, a.z * b.z};
}

inline double dot(const Vec3& a, const Vec3& b) {
    return a.x * b.x + a.y * b.y + a.z * b.z;
}

inline double norm(const Vec3& v) {
    return std::sqrt(dot(v, v));
}

inline double norm(double x, double y, double z) {
    return std::sqrt(x * x + y * y + z * z);
}

inline std::ostream& operator<<(std::ostream& os, const Vec3& v) {
    os << "(" << v.x << ", " << v.y << ", " << v.z << ")";
    return os;
}

inline double quietNaN() {
    return std::numeric_limits<double>::quiet_NaN();
}

template <typename It>
double mean(It first, It last) {
    auto count = std::distance(first, last);
    if (count <= 0) {
        return quietNaN();
    }
    return std::accumulate(first, last, 0.0) / static_cast<double>(count);
}

template <typename T>
double mean(const std::vector<T>& values) {
    return mean(values.begin(), values.end());
}

// Sample standard deviation (n - 1 denominator). Zero for fewer than two values.
template <typename It>
double sampleStdDev(It first, It last) {
    auto count = std::distance(first, last);
    if (count < 2) {
        return 0.0;
    }
    double avg = mean(first, last);
    double accum = 0.0;
    for (It it = first; it != last; ++it) {
        double diff = static_cast<double>(*it) - avg;
        accum += diff * diff;
    }
    return std::sqrt(accum / static_cast<double>(count - 1));
}

template <typename T>
double sampleStdDev(const std::vector<T>& values) {
    return sampleStdDev(values.begin(), values.end());
}

// Linear-interpolated percentile (0..100) of the finite values. NaN when none.
inline double percentile(std::vector<double> values, double p) {
    values.erase(std::remove_if(values.begin(), values.end(), [](double v) { return !std::isfinite(v); }),
                 values.end());
    if (values.empty()) {
        return quietNaN();
    }
    std::sort(values.begin(), values.end());
    double idx = std::clamp(p, 0.0, 100.0) / 100.0 * static_cast<double>(values.size() - 1);
    auto lo = static_cast<std::size_t>(std::floor(idx));
    auto hi = static_cast<std::size_t>(std::ceil(idx));
    double frac = idx - static_cast<double>(lo);
    return values[lo] * (1.0 - frac) + values[hi] * frac;
}

inline double median(std::vector<double> values) {
    return percentile(std::move(values), 50.0);
}

inline double roundTo(double value, int decimals) {
    double factor = std::pow(10.0, decimals);
    return std::round(value * factor) / factor;
}

}  // namespace acti
