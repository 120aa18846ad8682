// Copyright 2026 The qcloud Authors
// SPDX-License-Identifier: Apache-2.0

/**
 * @file sampling_context.hpp
 * @brief Long-lived factorial memo and generator for interactive sampling.
 *
 * One context backs a viewer session: successive single-orbital requests
 * continue the same random stream, so a fixed seed reproduces a session.
 * Calls may come from several threads (the Python bridge drops the GIL
 * while sampling); generator access is serialized, so concurrent calls
 * each receive a contiguous slice of the stream.
 *
 * Date: October, 2026
 */

#pragma once

#include <qcloud/sampling/atom_sampler.hpp>
#include <qcloud/special/special_functions.hpp>
#include <qcloud/utils/types.hpp>
#include <qcloud/wavefunction/wavefunction.hpp>

#include <cstddef>
#include <mutex>
#include <optional>
#include <random>

namespace qcloud {

class SamplingContext {
public:
    /// Unset seed → std::random_device
    explicit SamplingContext(std::optional<u64> seed = std::nullopt);

    SamplingContext(const SamplingContext&) = delete;
    SamplingContext& operator=(const SamplingContext&) = delete;

    void reseed(u64 seed);

    /// Shared memo (internally synchronized)
    [[nodiscard]] FactorialTable& factorials() noexcept { return facts_; }

    /**
     * generate_orbital_samples() on this context's stream.
     * Holds the generator lock for the whole walk.
     *
     * @throws std::invalid_argument Invalid state or sharpness
     */
    [[nodiscard]] SampleBatch generate(const QuantumState& qs,
                                       std::size_t count,
                                       double sharpness,
                                       DensityModel model = DensityModel::Real);

private:
    FactorialTable  facts_;
    std::mutex      rng_mtx_;
    std::mt19937_64 rng_;
};

} // namespace qcloud
