// Copyright 2026 The qcloud Authors
// SPDX-License-Identifier: Apache-2.0

/**
 * @file special_functions.cpp
 * @brief Recurrence-based special functions.
 *
 * Date: October, 2026
 */

#include <qcloud/special/special_functions.hpp>

#include <cmath>
#include <cstdlib>

namespace qcloud {

// ============================================================================
// FactorialTable
// ============================================================================

FactorialTable::FactorialTable() : cache_{1.0, 1.0} {
    cache_.reserve(32);
}

double FactorialTable::operator()(int k) {
    if (k < 0) return 1.0;

    const auto idx = static_cast<std::size_t>(k);
    std::lock_guard<std::mutex> lock(mtx_);

    if (idx < cache_.size()) return cache_[idx];

    // Extend from the last cached entry only
    double acc = cache_.back();
    for (std::size_t i = cache_.size(); i <= idx; ++i) {
        acc *= static_cast<double>(i);
        cache_.push_back(acc);
        steps_.fetch_add(1, std::memory_order_relaxed);
    }
    return acc;
}

std::size_t FactorialTable::size() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return cache_.size();
}

void FactorialTable::reset() {
    std::lock_guard<std::mutex> lock(mtx_);
    cache_.assign({1.0, 1.0});
    steps_.store(0, std::memory_order_relaxed);
}

// ============================================================================
// Laguerre
// ============================================================================

double laguerre(int n, double alpha, double x) noexcept {
    if (n < 0) return 0.0;
    if (n == 0) return 1.0;

    double l_prev = 1.0;
    double l_curr = 1.0 + alpha - x;
    for (int k = 1; k < n; ++k) {
        const double l_next =
            ((2.0 * k + 1.0 + alpha - x) * l_curr - (k + alpha) * l_prev) / (k + 1.0);
        l_prev = l_curr;
        l_curr = l_next;
    }
    return l_curr;
}

// ============================================================================
// Associated Legendre
// ============================================================================

double legendre(int l, int m, double x) noexcept {
    const int abs_m = std::abs(m);
    if (l < 0 || abs_m > l) return 0.0;

    // P_m^m via (2m-1)!! product; sqrt((1-x)(1+x)) keeps precision near |x|=1
    double pmm = 1.0;
    if (abs_m > 0) {
        const double somx2 = std::sqrt((1.0 - x) * (1.0 + x));
        double odd = 1.0;
        for (int i = 1; i <= abs_m; ++i) {
            pmm *= -odd * somx2;
            odd += 2.0;
        }
    }
    if (l == abs_m) return pmm;

    double pmmp1 = x * (2.0 * abs_m + 1.0) * pmm;
    if (l == abs_m + 1) return pmmp1;

    double pll = 0.0;
    for (int ll = abs_m + 2; ll <= l; ++ll) {
        pll = (x * (2.0 * ll - 1.0) * pmmp1 - (ll + abs_m - 1.0) * pmm) / (ll - abs_m);
        pmm = pmmp1;
        pmmp1 = pll;
    }
    return pll;
}

} // namespace qcloud
