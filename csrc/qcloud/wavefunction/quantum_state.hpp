// Copyright 2026 The qcloud Authors
// SPDX-License-Identifier: Apache-2.0

/**
 * @file quantum_state.hpp
 * @brief Hydrogen-like orbital label (n, l, m, Zeff).
 *
 * Date: October, 2026
 */

#pragma once

#include <qcloud/utils/constants.hpp>

#include <string>

namespace qcloud {

/**
 * Quantum numbers of a single hydrogen-like orbital.
 *
 * Invariant (for evaluator inputs): n ≥ 1, 0 ≤ l < n, |m| ≤ l, zeff > 0.
 * The evaluator assumes it; use clamped() or validate() at the boundary.
 */
struct QuantumState {
    int    n    = 1;    ///< Principal quantum number
    int    l    = 0;    ///< Angular momentum
    int    m    = 0;    ///< Magnetic quantum number (real-orbital convention)
    double zeff = 1.0;  ///< Effective nuclear charge

    constexpr bool operator==(const QuantumState&) const = default;

    /**
     * @brief Repair transient invalid input.
     *
     * n → max(n, 1); l → clamp to [0, n-1]; m → sign(m)·l when |m| > l;
     * zeff → max(zeff, ZEFF_FLOOR) (NaN also maps to the floor).
     */
    [[nodiscard]] static QuantumState clamped(int n, int l, int m, double zeff) noexcept;

    /// Invariant check without side effects
    [[nodiscard]] bool is_valid() const noexcept;

    /**
     * @brief Strict boundary check.
     * @throws std::invalid_argument Describing the violated invariant
     */
    void validate() const;

    /// Spectroscopic label, e.g. "2p(m=-1)"
    [[nodiscard]] std::string label() const;
};

/// Subshell label "1s", "3d", ... (letters beyond 'i' render as '?')
[[nodiscard]] std::string subshell_label(int n, int l);

} // namespace qcloud
