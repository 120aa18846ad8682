// Copyright 2026 The qcloud Authors
// SPDX-License-Identifier: Apache-2.0

/**
 * @file periodic_table.hpp
 * @brief Element symbols for labelling atoms in logs and the bridge.
 */

#pragma once

#include <string_view>

namespace qcloud {

/// Heaviest element with a symbol in the table
inline constexpr int MAX_ATOMIC_NUMBER = 118;

/**
 * Chemical symbol for atomic number Z.
 * @return "?" for Z outside [1, MAX_ATOMIC_NUMBER]
 */
[[nodiscard]] std::string_view element_symbol(int Z) noexcept;

/**
 * Atomic number for a chemical symbol (case-sensitive, e.g. "Fe").
 * @return 0 if unknown
 */
[[nodiscard]] int atomic_number(std::string_view symbol) noexcept;

} // namespace qcloud
