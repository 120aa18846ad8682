// Copyright 2026 The qcloud Authors
// SPDX-License-Identifier: Apache-2.0

/**
 * @file orbital_color.cpp
 * @brief Orbital palette and HSL conversion.
 */

#include <qcloud/sampling/orbital_color.hpp>

#include <cmath>

namespace qcloud {

namespace {

constexpr Rgb kWhite {1.0f, 1.0f, 1.0f};
constexpr Rgb kGreen {0.0f, 1.0f, 0.0f};
constexpr Rgb kYellow{1.0f, 1.0f, 0.0f};
constexpr Rgb kCyan  {0.0f, 1.0f, 1.0f};
constexpr Rgb kBlue  {0.0f, 0.0f, 1.0f};

double hue_to_channel(double lo, double hi, double t) noexcept {
    if (t < 0.0) t += 1.0;
    if (t > 1.0) t -= 1.0;
    if (t < 1.0 / 6.0) return lo + (hi - lo) * 6.0 * t;
    if (t < 0.5)       return hi;
    if (t < 2.0 / 3.0) return lo + (hi - lo) * 6.0 * (2.0 / 3.0 - t);
    return lo;
}

/// Positive remainder in [0,1)
double wrap_unit(double x) noexcept {
    const double w = x - std::floor(x);
    return (w >= 1.0) ? 0.0 : w;
}

} // anonymous namespace

Rgb hsl_to_rgb(double h, double s, double l) noexcept {
    h = wrap_unit(h);
    if (s <= 0.0) {
        const auto v = static_cast<f32>(l);
        return {v, v, v};
    }
    const double hi = (l <= 0.5) ? l * (1.0 + s) : l + s - l * s;
    const double lo = 2.0 * l - hi;
    return {
        static_cast<f32>(hue_to_channel(lo, hi, h + 1.0 / 3.0)),
        static_cast<f32>(hue_to_channel(lo, hi, h)),
        static_cast<f32>(hue_to_channel(lo, hi, h - 1.0 / 3.0)),
    };
}

Rgb orbital_color(int n, int l, int m) noexcept {
    if (n == 1 && l == 0) return kWhite;
    if (n == 2 && l == 0) return kGreen;
    if (n == 2 && l == 1) {
        if (m == 0)  return kYellow;  // pz
        if (m == 1)  return kCyan;    // px
        if (m == -1) return kBlue;    // py
    }

    double hue = wrap_unit(n * 0.13 + l * 0.07);
    if (l > 0) {
        hue = wrap_unit(hue + 0.1 * m / (2.0 * l + 1.0));
    }
    return hsl_to_rgb(hue, 0.9, 0.6);
}

} // namespace qcloud
