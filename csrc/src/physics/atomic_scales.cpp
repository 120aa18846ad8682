// Copyright 2026 The qcloud Authors
// SPDX-License-Identifier: Apache-2.0

/**
 * @file atomic_scales.cpp
 * @brief Orbital extents and fine-structure stability regimes.
 */

#include <qcloud/physics/atomic_scales.hpp>

namespace qcloud {

OrbitalExtent orbital_extent(int n, int l) noexcept {
    OrbitalExtent e;
    e.expected_radius = 1.5 * n * n - 0.5 * l * (l + 1);
    e.max_extent = 1.5 * e.expected_radius;
    return e;
}

std::string_view to_string(StabilityRegime r) noexcept {
    switch (r) {
        case StabilityRegime::Stable:               return "stable";
        case StabilityRegime::RelativisticCollapse: return "relativistic_collapse";
        case StabilityRegime::Unbound:              return "unbound";
    }
    return "unknown";
}

StabilityRegime classify_stability(int Z, double alpha_scale) noexcept {
    const double alpha = FINE_STRUCTURE * alpha_scale;
    if (Z * alpha > CRITICAL_Z_ALPHA) return StabilityRegime::RelativisticCollapse;
    if (alpha < MIN_BINDING_ALPHA)    return StabilityRegime::Unbound;
    return StabilityRegime::Stable;
}

double ground_state_binding_ev(int Z, double alpha_scale) noexcept {
    return RYDBERG_EV * Z * Z * alpha_scale * alpha_scale;
}

double length_scale_for_alpha(double alpha_scale) noexcept {
    return alpha_scale > 0.0 ? 1.0 / alpha_scale : 1.0;
}

} // namespace qcloud
