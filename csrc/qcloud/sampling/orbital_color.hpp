// Copyright 2026 The qcloud Authors
// SPDX-License-Identifier: Apache-2.0

/**
 * @file orbital_color.hpp
 * @brief Display palette keyed by (n, l, m).
 *
 * Fixed colors for the shells users compare most (1s white, 2s green,
 * 2p z/x/y as yellow/cyan/blue); everything else gets an HSL hue from
 * n and l, nudged by m so lobes of one subshell stay distinguishable.
 */

#pragma once

#include <qcloud/utils/types.hpp>

namespace qcloud {

/// HSL → RGB, all components in [0,1]; hue wraps
[[nodiscard]] Rgb hsl_to_rgb(double h, double s, double l) noexcept;

/**
 * Renderer color for orbital (n, l, m).
 *
 * Fallback hue: (0.13 n + 0.07 l) mod 1, shifted by 0.1 m/(2l+1) for
 * l > 0; saturation 0.9, lightness 0.6.
 */
[[nodiscard]] Rgb orbital_color(int n, int l, int m) noexcept;

} // namespace qcloud
