// Copyright 2026 The qcloud Authors
// SPDX-License-Identifier: Apache-2.0

/**
 * @file electron_config.hpp
 * @brief Ground-state electron configuration and Slater screening.
 *
 * Builds the occupied subshells of a neutral atom by Aufbau (Madelung)
 * filling, splits each subshell into distinguishable spatial orbitals,
 * and attaches an effective nuclear charge from simplified Slater rules.
 *
 * Screening groups electrons by principal quantum number only (not the
 * full (ns,np)(nd)(nf) grouping of Slater's original rules):
 *   same n     : 0.35 per other electron (0.30 within n = 1)
 *   n - 1      : 0.85
 *   ≤ n - 2    : 1.00
 *   higher n   : 0
 *   Z_eff = max(Z - S, ZEFF_FLOOR)
 *
 * Date: October, 2026
 */

#pragma once

#include <qcloud/wavefunction/quantum_state.hpp>

#include <array>
#include <string>
#include <vector>

namespace qcloud {

/// Static subshell descriptor (n, l, capacity = 2(2l+1))
struct SubshellSpec {
    int n;
    int l;
    int capacity;
};

/// Madelung filling order, 1s through 6d
inline constexpr std::array<SubshellSpec, 18> AUFBAU_ORDER = {{
    {1, 0, 2},
    {2, 0, 2}, {2, 1, 6},
    {3, 0, 2}, {3, 1, 6},
    {4, 0, 2}, {3, 2, 10}, {4, 1, 6},
    {5, 0, 2}, {4, 2, 10}, {5, 1, 6},
    {6, 0, 2}, {4, 3, 14}, {5, 2, 10}, {6, 1, 6},
    {7, 0, 2}, {5, 3, 14}, {6, 2, 10},
}};

/// Total electrons the filling table can hold
[[nodiscard]] constexpr int aufbau_capacity() noexcept {
    int total = 0;
    for (const auto& s : AUFBAU_ORDER) total += s.capacity;
    return total;
}

/**
 * Occupied subshell of an atom.
 * Constructed fresh per query; only zeff is written after filling.
 */
struct Subshell {
    int    n         = 1;
    int    l         = 0;
    int    capacity  = 2;
    int    occupied  = 0;    ///< Electrons placed (1..capacity)
    double zeff      = 1.0;  ///< Screened charge seen by each electron

    /// Distinguishable spatial orbitals in use: min(occupied, 2l+1)
    [[nodiscard]] int n_orbitals() const noexcept;

    [[nodiscard]] std::string label() const { return subshell_label(n, l); }
};

/**
 * One spatial orientation within a subshell.
 * Electrons sharing an Orbital (occupancy 2) do not change its shape.
 */
struct Orbital {
    int    n         = 1;
    int    l         = 0;
    int    m         = 0;
    int    occupancy = 1;    ///< 1 or 2 electrons
    double zeff      = 1.0;

    [[nodiscard]] QuantumState state() const noexcept { return {n, l, m, zeff}; }
};

/**
 * Display order of m values: 0, +1, -1, +2, -2, ..., +l, -l.
 * For p this is z, x, y under the real-orbital convention.
 */
[[nodiscard]] std::vector<int> display_m_order(int l);

/**
 * Fill subshells for atomic number Z and attach Slater Z_eff.
 *
 * Z ≤ 0 yields an empty list; Z beyond aufbau_capacity() is truncated
 * to what fits (logged as a warning). Never throws.
 */
[[nodiscard]] std::vector<Subshell> build_subshells(int Z);

/**
 * Slater screening constant S for one electron in shell n.
 *
 * @param subshells Filled configuration (all electrons, including self)
 * @param n         Shell of the target electron (must be occupied)
 */
[[nodiscard]] double slater_screening(const std::vector<Subshell>& subshells, int n) noexcept;

/// Z - S, floored at ZEFF_FLOOR
[[nodiscard]] double effective_charge(int Z, double screening) noexcept;

/**
 * Expand subshells into distinguishable orbitals.
 *
 * Electron i of a subshell goes to orbital i mod (2l+1) in display order,
 * so orbitals are singly occupied before any doubles up. Orbital order
 * follows Aufbau, then display m order.
 */
[[nodiscard]] std::vector<Orbital> expand_orbitals(const std::vector<Subshell>& subshells);

/// build_subshells(Z) expanded into orbitals
[[nodiscard]] std::vector<Orbital> electron_configuration(int Z);

/// Sum of orbital occupancies
[[nodiscard]] int total_electrons(const std::vector<Orbital>& orbitals) noexcept;

/// Conventional notation, e.g. "1s2 2s2 2p2"
[[nodiscard]] std::string configuration_string(const std::vector<Subshell>& subshells);

} // namespace qcloud
