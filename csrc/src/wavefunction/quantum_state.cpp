// Copyright 2026 The qcloud Authors
// SPDX-License-Identifier: Apache-2.0

/**
 * @file quantum_state.cpp
 * @brief Quantum number clamping and validation.
 */

#include <qcloud/wavefunction/quantum_state.hpp>

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <iterator>
#include <stdexcept>

namespace qcloud {

QuantumState QuantumState::clamped(int n, int l, int m, double zeff) noexcept {
    QuantumState qs;
    qs.n = std::max(n, 1);
    qs.l = std::clamp(l, 0, qs.n - 1);
    qs.m = (std::abs(m) > qs.l) ? (m < 0 ? -qs.l : qs.l) : m;
    qs.zeff = (zeff > ZEFF_FLOOR) ? zeff : ZEFF_FLOOR;  // false for NaN
    return qs;
}

bool QuantumState::is_valid() const noexcept {
    return n >= 1 && l >= 0 && l < n && std::abs(m) <= l
        && std::isfinite(zeff) && zeff > 0.0;
}

void QuantumState::validate() const {
    if (n < 1) {
        throw std::invalid_argument(
            "QuantumState: n=" + std::to_string(n) + " must be >= 1");
    }
    if (l < 0 || l >= n) {
        throw std::invalid_argument(
            "QuantumState: l=" + std::to_string(l) + " out of range [0," +
            std::to_string(n - 1) + "]");
    }
    if (std::abs(m) > l) {
        throw std::invalid_argument(
            "QuantumState: |m|=" + std::to_string(std::abs(m)) + " exceeds l=" +
            std::to_string(l));
    }
    if (!std::isfinite(zeff) || zeff <= 0.0) {
        throw std::invalid_argument(
            "QuantumState: zeff=" + std::to_string(zeff) + " must be positive");
    }
}

std::string QuantumState::label() const {
    return subshell_label(n, l) + "(m=" + std::to_string(m) + ")";
}

std::string subshell_label(int n, int l) {
    const bool known = l >= 0 && l < static_cast<int>(std::size(SUBSHELL_LETTERS));
    return std::to_string(n) + (known ? SUBSHELL_LETTERS[l] : '?');
}

} // namespace qcloud
