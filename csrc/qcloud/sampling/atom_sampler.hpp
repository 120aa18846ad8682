// Copyright 2026 The qcloud Authors
// SPDX-License-Identifier: Apache-2.0

/**
 * @file atom_sampler.hpp
 * @brief Electron-cloud sampling for single orbitals and whole atoms.
 *
 * sample_atom() fans the Metropolis sampler out over every occupied
 * orbital of the ground-state configuration:
 *   - step     = step_factor · n² / Z_eff   (diffuse orbitals walk wider)
 *   - budget   = count_per_electron · occupancy (constant density per electron)
 *   - color    = orbital_color(n, l, m)
 * Orbitals are walked in parallel (OpenMP), each with its own generator
 * seeded from (seed, orbital index); output is concatenated in orbital
 * order, so a fixed seed gives identical clouds for any thread count.
 *
 * Date: October, 2026
 */

#pragma once

#include <qcloud/configuration/electron_config.hpp>
#include <qcloud/sampling/metropolis.hpp>
#include <qcloud/special/special_functions.hpp>
#include <qcloud/utils/types.hpp>
#include <qcloud/wavefunction/wavefunction.hpp>

#include <cstddef>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace qcloud {

/**
 * Whole-atom sampling configuration.
 *
 * sharpness defaults to 1 (density-faithful) since atoms overlay many
 * orbitals and relative weights matter.
 */
struct AtomSamplingOptions {
    double sharpness    = 1.0;    ///< Acceptance exponent
    int    burn_in      = 200;    ///< Enough to leave the start region
    int    thinning     = 1;      ///< Steps per emitted point
    double step_factor  = 1.5;    ///< Multiplier on n²/Z_eff
    double length_scale = 1.0;    ///< Spatial rescale h (see physics/atomic_scales.hpp)
    DensityModel model  = DensityModel::Real;
    std::optional<u64> seed;      ///< Unset → std::random_device
    std::vector<std::string> hidden_subshells;  ///< Labels to skip, e.g. "1s"
};

/**
 * Point cloud of one atom in CSR layout.
 *
 * Points of orbitals[k] occupy [offsets[k], offsets[k+1]) in positions
 * and colors.
 */
struct AtomCloud {
    int Z = 0;
    std::vector<Orbital>     orbitals;
    std::vector<std::size_t> offsets{0};
    SampleBatch              positions;
    std::vector<Rgb>         colors;

    [[nodiscard]] std::size_t size()  const noexcept { return positions.size(); }
    [[nodiscard]] bool        empty() const noexcept { return positions.empty(); }

    /// Points emitted for orbital k
    [[nodiscard]] std::size_t orbital_size(std::size_t k) const noexcept {
        return offsets[k + 1] - offsets[k];
    }

    /**
     * Orbital that emitted point i.
     * @throws std::out_of_range i ≥ size()
     */
    [[nodiscard]] std::size_t orbital_index(std::size_t i) const;
};

/**
 * Sample a single orbital.
 *
 * Walk: start (1,1,1), step 1.5 n / Z_eff, 500 burn-in steps.
 *
 * @param qs        Orbital (validated; invalid input throws)
 * @param count     Points to emit
 * @param sharpness Acceptance exponent (2 = tightened, 1 = faithful)
 * @param rng       Generator; consumed sequentially
 * @param facts     Factorial memo for normalization constants
 * @param model     Real (lobes) or Complex (rings) angular basis
 * @throws std::invalid_argument Invalid state or sharpness
 */
[[nodiscard]] SampleBatch generate_orbital_samples(const QuantumState& qs,
                                                   std::size_t count,
                                                   double sharpness,
                                                   std::mt19937_64& rng,
                                                   FactorialTable& facts,
                                                   DensityModel model = DensityModel::Real);

/**
 * Sample every occupied orbital of atom Z.
 *
 * Non-positive Z or count_per_electron yields an empty cloud (orbitals
 * are still reported for Z > 0).
 *
 * @throws std::invalid_argument Invalid sampling options
 */
[[nodiscard]] AtomCloud sample_atom(int Z, int count_per_electron,
                                    FactorialTable& facts,
                                    const AtomSamplingOptions& opt = {});

} // namespace qcloud
