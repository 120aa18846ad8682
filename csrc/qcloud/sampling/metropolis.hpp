// Copyright 2026 The qcloud Authors
// SPDX-License-Identifier: Apache-2.0

/**
 * @file metropolis.hpp
 * @brief Random-walk Metropolis-Hastings sampler over unnormalized 3-D densities.
 *
 * Proposal: symmetric uniform jitter, each axis in [-σ/2, σ/2].
 * Acceptance for candidate density f' against current f:
 *   f' > f              → accept (no random draw consumed)
 *   otherwise           → accept iff u < (f'/f)^p,  u ~ U[0,1)
 *   f = 0               → ratio taken as 1 (always accept; escapes nodes
 *                         and the origin singularity)
 * Negative or non-finite densities are treated as 0.
 *
 * p = 1 samples the density itself; p = 2 samples f² (visually tighter
 * clouds). Output is the walker position after every step, accepted or
 * not: repeated emission of an unmoved point encodes higher density.
 *
 * Samples are Markov-correlated by construction. A walk is sequential;
 * parallelism belongs to callers running independent walkers.
 *
 * Usage:
 * @code
 *   WaveFunction wf(state, facts);
 *   MetropolisSampler mh({.step = 3.0, .burn_in = 500, .sharpness = 1.0});
 *   std::mt19937_64 rng(42);
 *   auto pts = mh.run([&](const Point3& p) { return wf.real_density(p); },
 *                     10000, rng);
 * @endcode
 *
 * Date: October, 2026
 */

#pragma once

#include <qcloud/utils/types.hpp>

#include <cmath>
#include <cstddef>
#include <random>

namespace qcloud {

/**
 * Sampler configuration.
 *
 * Defaults reproduce the single-orbital viewer: unit step, 500 burn-in
 * steps, squared acceptance, one emitted point per step, start at (1,1,1).
 */
struct SamplerOptions {
    double step      = 1.0;    ///< Proposal width σ (Bohr)
    int    burn_in   = 500;    ///< Steps discarded before recording
    double sharpness = 2.0;    ///< Acceptance exponent p
    int    thinning  = 1;      ///< Steps per emitted point (≥ 1)
    Point3 start     = Point3(1.0, 1.0, 1.0);  ///< Must not be the origin
};

/**
 * @brief Reject unusable options.
 * @throws std::invalid_argument step ≤ 0 or non-finite, burn_in < 0,
 *         sharpness ≤ 0 or non-finite, thinning < 1, start at the origin
 *         or non-finite
 */
void validate_options(const SamplerOptions& opt);

/// Mutable chain state, owned by one run
struct Walker {
    Point3 position = Point3::Zero();
    double density  = 0.0;
};

/// Acceptance bookkeeping for diagnostics
struct WalkStats {
    u64 proposed = 0;
    u64 accepted = 0;

    [[nodiscard]] double acceptance_rate() const noexcept {
        return proposed == 0 ? 0.0 : static_cast<double>(accepted) / static_cast<double>(proposed);
    }
};

/// Map negative, NaN and ±inf densities to 0
[[nodiscard]] inline double sanitize_density(double d) noexcept {
    return (std::isfinite(d) && d > 0.0) ? d : 0.0;
}

/**
 * @class MetropolisSampler
 * @brief Stateless driver; every run() owns a fresh Walker.
 *
 * Density: callable double(const Point3&)
 * Rng    : UniformRandomBitGenerator (std::mt19937_64 in the library)
 */
class MetropolisSampler {
public:
    /// @throws std::invalid_argument via validate_options()
    explicit MetropolisSampler(const SamplerOptions& opt);

    [[nodiscard]] const SamplerOptions& options() const noexcept { return opt_; }

    /**
     * One proposal/acceptance step.
     * @return true if the proposal was accepted
     */
    template<typename Density, typename Rng>
    bool step(Walker& w, Density&& density, Rng& rng) const {
        std::uniform_real_distribution<double> jitter(-0.5 * opt_.step, 0.5 * opt_.step);

        // Separate statements: argument evaluation order is unspecified
        const double dx = jitter(rng);
        const double dy = jitter(rng);
        const double dz = jitter(rng);
        const Point3 cand = w.position + Point3(dx, dy, dz);
        const double cand_density = sanitize_density(density(cand));

        bool accept = cand_density > w.density;
        if (!accept) {
            const double ratio = (w.density == 0.0) ? 1.0 : cand_density / w.density;
            std::uniform_real_distribution<double> unit(0.0, 1.0);
            accept = unit(rng) < std::pow(ratio, opt_.sharpness);
        }

        if (accept) {
            w.position = cand;
            w.density = cand_density;
        }
        return accept;
    }

    /**
     * Burn in, then append `count` positions to `out`.
     *
     * @param stats Optional acceptance counters (burn-in excluded)
     */
    template<typename Density, typename Rng>
    void run_into(Density&& density, std::size_t count, Rng& rng,
                  SampleBatch& out, WalkStats* stats = nullptr) const {
        Walker w;
        w.position = opt_.start;
        w.density = sanitize_density(density(w.position));

        for (int i = 0; i < opt_.burn_in; ++i) {
            step(w, density, rng);
        }

        out.reserve(out.size() + count);
        for (std::size_t i = 0; i < count; ++i) {
            for (int k = 0; k < opt_.thinning; ++k) {
                const bool accepted = step(w, density, rng);
                if (stats) {
                    ++stats->proposed;
                    if (accepted) ++stats->accepted;
                }
            }
            out.push_back(w.position);
        }
    }

    /// run_into() on a fresh batch
    template<typename Density, typename Rng>
    [[nodiscard]] SampleBatch run(Density&& density, std::size_t count, Rng& rng,
                                  WalkStats* stats = nullptr) const {
        SampleBatch out;
        run_into(density, count, rng, out, stats);
        return out;
    }

private:
    SamplerOptions opt_;
};

} // namespace qcloud
