// Copyright 2026 The qcloud Authors
// SPDX-License-Identifier: Apache-2.0

/**
 * @file electron_config.cpp
 * @brief Aufbau filling, orbital expansion and Slater screening.
 *
 * Date: October, 2026
 */

#include <qcloud/configuration/electron_config.hpp>
#include <qcloud/utils/constants.hpp>
#include <qcloud/utils/log.hpp>

#include <algorithm>

namespace qcloud {

namespace {

static_assert(aufbau_capacity() == 112, "Aufbau table must end at 6d");

/**
 * Electron count per principal quantum number.
 * Index 0 unused; sized for the deepest shell in the table.
 */
std::array<int, MAX_PRINCIPAL_N + 1> count_by_shell(const std::vector<Subshell>& subshells) noexcept {
    std::array<int, MAX_PRINCIPAL_N + 1> counts{};
    for (const auto& s : subshells) {
        if (s.n >= 1 && s.n <= MAX_PRINCIPAL_N) counts[s.n] += s.occupied;
    }
    return counts;
}

} // anonymous namespace

int Subshell::n_orbitals() const noexcept {
    return std::min(occupied, 2 * l + 1);
}

std::vector<int> display_m_order(int l) {
    std::vector<int> order;
    if (l < 0) return order;
    order.reserve(static_cast<size_t>(2 * l + 1));
    order.push_back(0);
    for (int k = 1; k <= l; ++k) {
        order.push_back(k);
        order.push_back(-k);
    }
    return order;
}

double slater_screening(const std::vector<Subshell>& subshells, int n) noexcept {
    const auto counts = count_by_shell(subshells);

    double s = 0.0;
    for (int shell = 1; shell <= MAX_PRINCIPAL_N; ++shell) {
        const int c = counts[shell];
        if (c == 0 || shell > n) continue;

        if (shell == n) {
            const double w = (n == 1) ? SLATER_SAME_SHELL_1S : SLATER_SAME_SHELL;
            s += w * std::max(c - 1, 0);  // exclude self
        } else if (shell == n - 1) {
            s += SLATER_INNER_SHELL * c;
        } else {
            s += SLATER_DEEP_SHELL * c;
        }
    }
    return s;
}

double effective_charge(int Z, double screening) noexcept {
    return std::max(static_cast<double>(Z) - screening, ZEFF_FLOOR);
}

std::vector<Subshell> build_subshells(int Z) {
    std::vector<Subshell> out;
    if (Z <= 0) {
        log::debug("build_subshells: Z={} has no electrons", Z);
        return out;
    }
    if (Z > aufbau_capacity()) {
        log::warn("build_subshells: Z={} exceeds filling table; truncating to {} electrons",
                  Z, aufbau_capacity());
    }

    int remaining = Z;
    for (const auto& entry : AUFBAU_ORDER) {
        if (remaining <= 0) break;
        const int count = std::min(remaining, entry.capacity);
        remaining -= count;
        out.push_back(Subshell{entry.n, entry.l, entry.capacity, count, 1.0});
    }

    // Zeff is a function of n only under the simplified grouping
    for (auto& s : out) {
        s.zeff = effective_charge(Z, slater_screening(out, s.n));
    }
    return out;
}

std::vector<Orbital> expand_orbitals(const std::vector<Subshell>& subshells) {
    std::vector<Orbital> out;
    for (const auto& s : subshells) {
        if (s.occupied <= 0) continue;

        const auto m_order = display_m_order(s.l);
        const int n_spatial = 2 * s.l + 1;
        const int n_used = s.n_orbitals();
        const int base = s.occupied / n_spatial;
        const int extra = s.occupied % n_spatial;

        for (int k = 0; k < n_used; ++k) {
            const int occ = base + (k < extra ? 1 : 0);
            out.push_back(Orbital{s.n, s.l, m_order[static_cast<size_t>(k)], occ, s.zeff});
        }
    }
    return out;
}

std::vector<Orbital> electron_configuration(int Z) {
    return expand_orbitals(build_subshells(Z));
}

int total_electrons(const std::vector<Orbital>& orbitals) noexcept {
    int total = 0;
    for (const auto& o : orbitals) total += o.occupancy;
    return total;
}

std::string configuration_string(const std::vector<Subshell>& subshells) {
    std::string out;
    for (const auto& s : subshells) {
        if (!out.empty()) out += ' ';
        out += s.label() + std::to_string(s.occupied);
    }
    return out;
}

} // namespace qcloud
