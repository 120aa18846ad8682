// Copyright 2026 The qcloud Authors
// SPDX-License-Identifier: Apache-2.0

/**
 * @file metropolis.cpp
 * @brief Sampler option validation.
 */

#include <qcloud/sampling/metropolis.hpp>

#include <stdexcept>
#include <string>

namespace qcloud {

void validate_options(const SamplerOptions& opt) {
    if (!std::isfinite(opt.step) || opt.step <= 0.0) {
        throw std::invalid_argument(
            "MetropolisSampler: step=" + std::to_string(opt.step) + " must be positive");
    }
    if (opt.burn_in < 0) {
        throw std::invalid_argument(
            "MetropolisSampler: burn_in=" + std::to_string(opt.burn_in) + " must be >= 0");
    }
    if (!std::isfinite(opt.sharpness) || opt.sharpness <= 0.0) {
        throw std::invalid_argument(
            "MetropolisSampler: sharpness=" + std::to_string(opt.sharpness) + " must be positive");
    }
    if (opt.thinning < 1) {
        throw std::invalid_argument(
            "MetropolisSampler: thinning=" + std::to_string(opt.thinning) + " must be >= 1");
    }
    if (!opt.start.allFinite() || opt.start.isZero(0.0)) {
        throw std::invalid_argument(
            "MetropolisSampler: start must be a finite point away from the origin");
    }
}

MetropolisSampler::MetropolisSampler(const SamplerOptions& opt) : opt_(opt) {
    validate_options(opt_);
}

} // namespace qcloud
