// Copyright 2026 The qcloud Authors
// SPDX-License-Identifier: Apache-2.0

/**
 * @file constants.hpp
 * @brief Library-wide compile-time constants.
 *
 * Date: October, 2026
 */

#pragma once

#include "types.hpp"
#include <numbers>

namespace qcloud {

inline constexpr double PI = std::numbers::pi;

// ============================================================================
// Quantum Number Limits
// ============================================================================

/**
 * Largest principal quantum number reached by the Aufbau table (7s).
 * Radial recurrences are exercised up to n - l - 1 = 6.
 */
inline constexpr int MAX_PRINCIPAL_N = 7;

/**
 * Largest angular momentum with a closed-form real orbital (d).
 * Higher l falls back to the s-like constant in the real evaluator.
 */
inline constexpr int MAX_REAL_ORBITAL_L = 2;

/// Subshell letters indexed by l
inline constexpr char SUBSHELL_LETTERS[] = {'s', 'p', 'd', 'f', 'g', 'h', 'i'};

// ============================================================================
// Numerical Floors
// ============================================================================

/**
 * Radius below which densities evaluate to 0.
 * Avoids the spherical-coordinate singularity at the origin.
 */
inline constexpr double R_MIN = 1e-6;

/**
 * Lower bound for effective nuclear charge.
 * Keeps heavily screened configurations from producing a flat
 * (or inverted) radial profile.
 */
inline constexpr double ZEFF_FLOOR = 0.1;

// ============================================================================
// Slater Screening Constants
// ============================================================================

inline constexpr double SLATER_SAME_SHELL    = 0.35;  ///< Same n, n > 1
inline constexpr double SLATER_SAME_SHELL_1S = 0.30;  ///< Same n, n = 1
inline constexpr double SLATER_INNER_SHELL   = 0.85;  ///< Shell n - 1
inline constexpr double SLATER_DEEP_SHELL    = 1.00;  ///< Shell <= n - 2

} // namespace qcloud
