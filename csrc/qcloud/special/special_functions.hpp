// Copyright 2026 The qcloud Authors
// SPDX-License-Identifier: Apache-2.0

/**
 * @file special_functions.hpp
 * @brief Factorial table, generalized Laguerre and associated Legendre
 *        polynomials for hydrogen-like wavefunctions.
 *
 * All polynomial kernels are pure and noexcept. Out-of-domain arguments
 * degrade to defined values (1 for negative factorials, 0 for |m| > l)
 * instead of raising, since transient invalid quantum numbers are routine
 * while the UI edits them.
 *
 * Date: October, 2026
 */

#pragma once

#include <qcloud/utils/types.hpp>

#include <atomic>
#include <cstddef>
#include <mutex>
#include <vector>

namespace qcloud {

/**
 * @class FactorialTable
 * @brief Append-only memo of k! in double precision.
 *
 * The table grows monotonically: a query for k beyond the cached range
 * extends it from the last cached entry, never recomputing earlier ones.
 * Extension is guarded by a mutex, so one table may be shared by the
 * parallel orchestrator. Lookups of cached entries take the same lock
 * (the vector may reallocate during extension).
 *
 * Instrumentation: extension_steps() counts recurrence multiplications
 * performed since construction or the last reset().
 */
class FactorialTable {
public:
    /// Seeded with 0! = 1! = 1.
    FactorialTable();

    FactorialTable(const FactorialTable&) = delete;
    FactorialTable& operator=(const FactorialTable&) = delete;

    /**
     * @brief k! for k >= 0; 1 for negative k.
     * @note 171! overflows to +inf, far beyond n + l = 10 used here.
     */
    [[nodiscard]] double operator()(int k);

    /// Number of cached entries (largest cached k is size() - 1)
    [[nodiscard]] std::size_t size() const;

    /// Recurrence multiplications performed so far
    [[nodiscard]] u64 extension_steps() const noexcept {
        return steps_.load(std::memory_order_relaxed);
    }

    /// Drop back to the seed entries and zero the step counter
    void reset();

private:
    mutable std::mutex  mtx_;
    std::vector<double> cache_;
    std::atomic<u64>    steps_{0};
};

/**
 * Generalized Laguerre polynomial L_n^α(x).
 *
 * Upward recurrence:
 *   (k+1) L_{k+1} = (2k+1+α-x) L_k - (k+α) L_{k-1}
 * seeded with L_0 = 1, L_1 = 1+α-x (exact for n = 0, 1).
 *
 * @return 0 for negative n
 */
[[nodiscard]] double laguerre(int n, double alpha, double x) noexcept;

/**
 * Associated Legendre polynomial P_l^{|m|}(x), x = cos θ ∈ [-1,1].
 *
 * Includes the Condon-Shortley phase (-1)^m:
 *   P_m^m     = (-1)^m (2m-1)!! (1-x²)^{m/2}
 *   P_{m+1}^m = x (2m+1) P_m^m
 *   (l-m) P_l^m = x (2l-1) P_{l-1}^m - (l+m-1) P_{l-2}^m
 *
 * @return 0 when |m| > l or l < 0
 */
[[nodiscard]] double legendre(int l, int m, double x) noexcept;

} // namespace qcloud
