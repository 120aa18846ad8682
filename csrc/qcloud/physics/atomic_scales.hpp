// Copyright 2026 The qcloud Authors
// SPDX-License-Identifier: Apache-2.0

/**
 * @file atomic_scales.hpp
 * @brief Physical constants, orbital extents and Z·α stability regimes.
 *
 * Lets the UI relate sampler coordinates (Bohr radii) to SI/Ångström and
 * explore a rescaled fine-structure constant α' = s·α:
 *   - lengths scale as h = 1/s (Bohr radius ∝ 1/α)
 *   - binding energies scale as s²
 *   - Z·α' > 1 marks the point-nucleus Dirac collapse
 *
 * Date: October, 2026
 */

#pragma once

#include <cstdint>
#include <string_view>

namespace qcloud {

// ============================================================================
// Constants (CODATA 2018)
// ============================================================================

inline constexpr double BOHR_RADIUS_M     = 0.529177210903e-10;  ///< a₀ [m]
inline constexpr double BOHR_RADIUS_ANG   = 0.529177210903;      ///< a₀ [Å]
inline constexpr double RYDBERG_EV        = 13.605693122994;     ///< Ry [eV]
inline constexpr double HARTREE_EV        = 27.211386245988;     ///< E_h [eV]
inline constexpr double FINE_STRUCTURE    = 1.0 / 137.035999084; ///< α

/// Z·α above which the bound Dirac state of a point nucleus fails
inline constexpr double CRITICAL_Z_ALPHA = 1.0;

/// α below which binding is treated as thermally dissolved
inline constexpr double MIN_BINDING_ALPHA = 1e-4;

// ============================================================================
// Orbital extent
// ============================================================================

/**
 * Approximate radial size of a hydrogen orbital.
 *
 * <r> = (3n²/2 - l(l+1)/2) a₀; the visual extent (≈95% of the density)
 * is taken as 1.5 <r>.
 */
struct OrbitalExtent {
    double expected_radius = 0.0;  ///< <r> [Bohr]
    double max_extent      = 0.0;  ///< 1.5 <r> [Bohr]

    [[nodiscard]] double max_extent_angstrom() const noexcept {
        return max_extent * BOHR_RADIUS_ANG;
    }
    [[nodiscard]] double max_extent_meters() const noexcept {
        return max_extent * BOHR_RADIUS_M;
    }
};

[[nodiscard]] OrbitalExtent orbital_extent(int n, int l) noexcept;

// ============================================================================
// Fine-structure scaling
// ============================================================================

enum class StabilityRegime : std::uint8_t {
    Stable,
    RelativisticCollapse,  ///< Z·α' > CRITICAL_Z_ALPHA
    Unbound                ///< α' < MIN_BINDING_ALPHA
};

[[nodiscard]] std::string_view to_string(StabilityRegime r) noexcept;

/**
 * Classify atom Z under α' = alpha_scale · α.
 * Collapse takes precedence over unbound.
 */
[[nodiscard]] StabilityRegime classify_stability(int Z, double alpha_scale) noexcept;

/// Bohr-model ground-state binding 13.6 eV · Z² · s²
[[nodiscard]] double ground_state_binding_ev(int Z, double alpha_scale) noexcept;

/**
 * Spatial scale h = 1/s for AtomSamplingOptions::length_scale.
 * Non-positive s maps to 1 (no rescale).
 */
[[nodiscard]] double length_scale_for_alpha(double alpha_scale) noexcept;

} // namespace qcloud
