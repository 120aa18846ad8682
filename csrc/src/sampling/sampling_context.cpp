// Copyright 2026 The qcloud Authors
// SPDX-License-Identifier: Apache-2.0

/**
 * @file sampling_context.cpp
 * @brief Serialized access to a session generator.
 */

#include <qcloud/sampling/sampling_context.hpp>

namespace qcloud {

namespace {

u64 seed_or_entropy(const std::optional<u64>& seed) {
    if (seed) return *seed;
    std::random_device rd;
    return (static_cast<u64>(rd()) << 32) | static_cast<u64>(rd());
}

} // anonymous namespace

SamplingContext::SamplingContext(std::optional<u64> seed)
    : rng_(seed_or_entropy(seed)) {}

void SamplingContext::reseed(u64 seed) {
    std::lock_guard<std::mutex> lock(rng_mtx_);
    rng_.seed(seed);
}

SampleBatch SamplingContext::generate(const QuantumState& qs,
                                      std::size_t count,
                                      double sharpness,
                                      DensityModel model) {
    std::lock_guard<std::mutex> lock(rng_mtx_);
    return generate_orbital_samples(qs, count, sharpness, rng_, facts_, model);
}

} // namespace qcloud
