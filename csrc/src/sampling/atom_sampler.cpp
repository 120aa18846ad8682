// Copyright 2026 The qcloud Authors
// SPDX-License-Identifier: Apache-2.0

/**
 * @file atom_sampler.cpp
 * @brief Orbital and whole-atom cloud generation.
 *
 * Date: October, 2026
 */

#include <qcloud/sampling/atom_sampler.hpp>

#include <qcloud/configuration/periodic_table.hpp>
#include <qcloud/sampling/orbital_color.hpp>
#include <qcloud/utils/log.hpp>

#include <algorithm>
#include <cmath>
#include <stdexcept>

#ifdef _OPENMP
  #include <omp.h>
#endif

namespace qcloud {

namespace {

constexpr int    kOrbitalBurnIn     = 500;
constexpr double kOrbitalStepFactor = 1.5;

void check_atom_options(const AtomSamplingOptions& opt) {
    if (!std::isfinite(opt.step_factor) || opt.step_factor <= 0.0) {
        throw std::invalid_argument(
            "sample_atom: step_factor=" + std::to_string(opt.step_factor) + " must be positive");
    }
    if (!std::isfinite(opt.length_scale) || opt.length_scale <= 0.0) {
        throw std::invalid_argument(
            "sample_atom: length_scale=" + std::to_string(opt.length_scale) + " must be positive");
    }
}

u64 resolve_seed(const std::optional<u64>& seed) {
    if (seed) return *seed;
    std::random_device rd;
    return (static_cast<u64>(rd()) << 32) | static_cast<u64>(rd());
}

bool is_hidden(const Orbital& o, const std::vector<std::string>& hidden) {
    if (hidden.empty()) return false;
    const std::string label = subshell_label(o.n, o.l);
    return std::find(hidden.begin(), hidden.end(), label) != hidden.end();
}

/// Everything one parallel task needs, built serially beforehand
struct OrbitalPlan {
    WaveFunction      wf;
    MetropolisSampler mh;
    std::size_t       budget;
};

} // anonymous namespace

// ============================================================================
// AtomCloud
// ============================================================================

std::size_t AtomCloud::orbital_index(std::size_t i) const {
    if (i >= size()) {
        throw std::out_of_range(
            "AtomCloud::orbital_index: point " + std::to_string(i) +
            " out of range [0," + std::to_string(size()) + ")");
    }
    // Empty orbitals repeat an offset; upper_bound skips past them
    const auto it = std::upper_bound(offsets.begin(), offsets.end(), i);
    return static_cast<std::size_t>(it - offsets.begin()) - 1;
}

// ============================================================================
// Single orbital
// ============================================================================

SampleBatch generate_orbital_samples(const QuantumState& qs,
                                     std::size_t count,
                                     double sharpness,
                                     std::mt19937_64& rng,
                                     FactorialTable& facts,
                                     DensityModel model) {
    qs.validate();

    SamplerOptions so;
    so.step = kOrbitalStepFactor * qs.n / qs.zeff;
    so.burn_in = kOrbitalBurnIn;
    so.sharpness = sharpness;

    const MetropolisSampler mh(so);
    const WaveFunction wf(qs, facts);

    return mh.run([&](const Point3& p) { return wf.density(p, model); }, count, rng);
}

// ============================================================================
// Whole atom
// ============================================================================

AtomCloud sample_atom(int Z, int count_per_electron,
                      FactorialTable& facts,
                      const AtomSamplingOptions& opt) {
    check_atom_options(opt);

    AtomCloud cloud;
    cloud.Z = Z;
    if (Z <= 0) return cloud;

    const auto config = electron_configuration(Z);
    int remaining = total_electrons(config);
    for (const auto& o : config) {
        if (remaining <= 0) break;
        if (o.occupancy <= 0) continue;
        remaining -= o.occupancy;
        if (is_hidden(o, opt.hidden_subshells)) continue;
        cloud.orbitals.push_back(o);
    }

    const std::size_t per_electron =
        count_per_electron > 0 ? static_cast<std::size_t>(count_per_electron) : 0;
    const double h = opt.length_scale;

    std::vector<OrbitalPlan> plans;
    plans.reserve(cloud.orbitals.size());
    for (const auto& o : cloud.orbitals) {
        const double scale = static_cast<double>(o.n * o.n) / o.zeff;

        SamplerOptions so;
        so.step = opt.step_factor * scale * h;
        so.burn_in = opt.burn_in;
        so.sharpness = opt.sharpness;
        so.thinning = opt.thinning;
        so.start = Point3::Constant(scale * h / std::sqrt(3.0));

        plans.push_back(OrbitalPlan{
            WaveFunction(o.state(), facts),
            MetropolisSampler(so),
            per_electron * static_cast<std::size_t>(o.occupancy)
        });
    }

    const std::size_t n_orb = plans.size();
    std::vector<SampleBatch> batches(n_orb);
    std::vector<WalkStats> stats(n_orb);
    const u64 seed = resolve_seed(opt.seed);
    const double inv_h3 = 1.0 / (h * h * h);

#pragma omp parallel for schedule(dynamic, 1)
    for (std::ptrdiff_t k = 0; k < static_cast<std::ptrdiff_t>(n_orb); ++k) {
        const OrbitalPlan& plan = plans[static_cast<std::size_t>(k)];
        if (plan.budget == 0) continue;

        std::seed_seq seq{static_cast<u32>(seed), static_cast<u32>(seed >> 32), static_cast<u32>(k)};
        std::mt19937_64 rng(seq);

        // Density of the orbital stretched by h: ρ(p/h) / h³
        plan.mh.run_into(
            [&](const Point3& p) { return plan.wf.density(p / h, opt.model) * inv_h3; },
            plan.budget, rng,
            batches[static_cast<std::size_t>(k)],
            &stats[static_cast<std::size_t>(k)]);
    }

    // Concatenate in orbital order
    std::size_t total = 0;
    for (const auto& b : batches) total += b.size();
    cloud.positions.reserve(total);
    cloud.colors.reserve(total);
    cloud.offsets.reserve(n_orb + 1);

    for (std::size_t k = 0; k < n_orb; ++k) {
        const Orbital& o = cloud.orbitals[k];
        const Rgb color = orbital_color(o.n, o.l, o.m);
        cloud.positions.insert(cloud.positions.end(), batches[k].begin(), batches[k].end());
        cloud.colors.insert(cloud.colors.end(), batches[k].size(), color);
        cloud.offsets.push_back(cloud.positions.size());

        log::debug("sample_atom: {} zeff={:.3f} occ={} step={:.3f} points={} acceptance={:.3f}",
                   o.state().label(), o.zeff, o.occupancy, plans[k].mh.options().step,
                   batches[k].size(), stats[k].acceptance_rate());
    }

    log::info("sample_atom: Z={} ({}) {} orbitals, {} points",
              Z, element_symbol(Z), cloud.orbitals.size(), cloud.size());
    return cloud;
}

} // namespace qcloud
