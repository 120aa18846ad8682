// Copyright 2026 The qcloud Authors
// SPDX-License-Identifier: Apache-2.0

/**
 * @file test_sampling.cpp
 * @brief Unit tests for the Metropolis sampler, orbital colors and atom clouds.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <qcloud/sampling/atom_sampler.hpp>
#include <qcloud/sampling/metropolis.hpp>
#include <qcloud/sampling/orbital_color.hpp>
#include <qcloud/sampling/sampling_context.hpp>
#include <qcloud/wavefunction/wavefunction.hpp>

#include <algorithm>
#include <cmath>
#include <limits>
#include <random>
#include <stdexcept>
#include <thread>
#include <vector>

#ifdef _OPENMP
  #include <omp.h>
#endif

using namespace qcloud;
using Catch::Approx;

namespace {

double mean_radius(const SampleBatch& pts) {
    double acc = 0.0;
    for (const auto& p : pts) acc += p.norm();
    return acc / static_cast<double>(pts.size());
}

double mean_r2(const SampleBatch& pts) {
    double acc = 0.0;
    for (const auto& p : pts) acc += p.squaredNorm();
    return acc / static_cast<double>(pts.size());
}

/// CDF of r⁴ e^{-r} / 4!, the hydrogen 2p radial distribution
double radial_cdf_2p(double r) {
    double term = 1.0, sum = 1.0;
    for (int k = 1; k < 5; ++k) {
        term *= r / k;
        sum += term;
    }
    return 1.0 - std::exp(-r) * sum;
}

/// Kolmogorov-Smirnov distance between sample radii and a CDF
template<typename Cdf>
double ks_distance(const SampleBatch& pts, Cdf&& cdf) {
    std::vector<double> r;
    r.reserve(pts.size());
    for (const auto& p : pts) r.push_back(p.norm());
    std::sort(r.begin(), r.end());

    const double N = static_cast<double>(r.size());
    double d = 0.0;
    for (std::size_t i = 0; i < r.size(); ++i) {
        const double F = cdf(r[i]);
        d = std::max({d, F - static_cast<double>(i) / N, static_cast<double>(i + 1) / N - F});
    }
    return d;
}

} // namespace

// -----------------------------------------------------------------------------
// Sampler options
// -----------------------------------------------------------------------------
TEST_CASE("MetropolisSampler: option validation", "[sampler]") {
    REQUIRE_NOTHROW(MetropolisSampler(SamplerOptions{}));

    SamplerOptions bad;
    SECTION("step") {
        bad.step = 0.0;
        REQUIRE_THROWS_AS(MetropolisSampler(bad), std::invalid_argument);
        bad.step = std::numeric_limits<double>::quiet_NaN();
        REQUIRE_THROWS_AS(MetropolisSampler(bad), std::invalid_argument);
    }
    SECTION("burn_in") {
        bad.burn_in = -1;
        REQUIRE_THROWS_AS(MetropolisSampler(bad), std::invalid_argument);
    }
    SECTION("sharpness") {
        bad.sharpness = -2.0;
        REQUIRE_THROWS_AS(MetropolisSampler(bad), std::invalid_argument);
    }
    SECTION("thinning") {
        bad.thinning = 0;
        REQUIRE_THROWS_AS(MetropolisSampler(bad), std::invalid_argument);
    }
    SECTION("start") {
        bad.start = Point3::Zero();
        REQUIRE_THROWS_AS(MetropolisSampler(bad), std::invalid_argument);
        bad.start = Point3(1.0, std::numeric_limits<double>::infinity(), 0.0);
        REQUIRE_THROWS_AS(MetropolisSampler(bad), std::invalid_argument);
    }
}

TEST_CASE("sanitize_density", "[sampler]") {
    REQUIRE(sanitize_density(0.5) == 0.5);
    REQUIRE(sanitize_density(-0.1) == 0.0);
    REQUIRE(sanitize_density(std::numeric_limits<double>::quiet_NaN()) == 0.0);
    REQUIRE(sanitize_density(std::numeric_limits<double>::infinity()) == 0.0);
}

// -----------------------------------------------------------------------------
// Walk mechanics
// -----------------------------------------------------------------------------
TEST_CASE("MetropolisSampler: emits exactly count points", "[sampler]") {
    std::mt19937_64 rng(1);
    const auto gauss = [](const Point3& p) { return std::exp(-p.squaredNorm()); };

    SamplerOptions opt;
    opt.burn_in = 10;
    const MetropolisSampler mh(opt);
    REQUIRE(mh.run(gauss, 0, rng).empty());
    REQUIRE(mh.run(gauss, 137, rng).size() == 137);

    SECTION("run_into appends") {
        SampleBatch out(3, Point3::Ones());
        mh.run_into(gauss, 20, rng, out);
        REQUIRE(out.size() == 23);
        REQUIRE(out[2].isApprox(Point3::Ones()));
    }

    SECTION("thinning counts proposals per emitted point") {
        opt.thinning = 5;
        const MetropolisSampler thin(opt);
        WalkStats stats;
        REQUIRE(thin.run(gauss, 40, rng, &stats).size() == 40);
        REQUIRE(stats.proposed == 200);
        REQUIRE(stats.accepted <= stats.proposed);
    }
}

TEST_CASE("MetropolisSampler: burn-in moves away from the start", "[sampler]") {
    std::mt19937_64 rng(2026);
    SamplerOptions opt;
    opt.burn_in = 1000;
    opt.step = 2.0;
    const MetropolisSampler mh(opt);

    const auto pts = mh.run([](const Point3& p) { return std::exp(-p.norm()); }, 1, rng);
    REQUIRE(pts.size() == 1);
    REQUIRE_FALSE(pts[0].isApprox(opt.start));
}

TEST_CASE("MetropolisSampler: zero and invalid densities always accept", "[sampler]") {
    std::mt19937_64 rng(3);
    SamplerOptions opt;
    opt.burn_in = 0;
    const MetropolisSampler mh(opt);

    WalkStats zero, nan;
    (void)mh.run([](const Point3&) { return 0.0; }, 500, rng, &zero);
    (void)mh.run([](const Point3&) { return std::numeric_limits<double>::quiet_NaN(); },
                 500, rng, &nan);
    REQUIRE(zero.accepted == zero.proposed);
    REQUIRE(nan.accepted == nan.proposed);
    REQUIRE(zero.acceptance_rate() == Approx(1.0));
}

TEST_CASE("MetropolisSampler: uphill moves always accept", "[sampler]") {
    std::mt19937_64 rng(4);
    SamplerOptions opt;
    const MetropolisSampler mh(opt);

    // Any candidate denser than the walker is taken without a coin flip
    Walker w;
    w.position = opt.start;
    w.density = 1.0;
    const auto ramp = [](const Point3&) { return 2.0; };
    REQUIRE(mh.step(w, ramp, rng));
    REQUIRE(w.density == 2.0);
    REQUIRE_FALSE(w.position.isApprox(opt.start));
}

TEST_CASE("MetropolisSampler: fixed seed reproduces the walk", "[sampler]") {
    const auto f = [](const Point3& p) { return std::exp(-p.norm()); };
    const MetropolisSampler mh(SamplerOptions{});

    std::mt19937_64 a(99), b(99), c(100);
    const auto pa = mh.run(f, 200, a);
    const auto pb = mh.run(f, 200, b);
    const auto pc = mh.run(f, 200, c);
    REQUIRE(pa == pb);
    REQUIRE_FALSE(pa == pc);
}

// -----------------------------------------------------------------------------
// Statistical checks against hydrogen moments
// -----------------------------------------------------------------------------
TEST_CASE("generate_orbital_samples: 2p radial moments", "[sampler][statistics]") {
    FactorialTable facts;
    std::mt19937_64 rng(12345);
    const QuantumState qs{2, 1, 0, 1.0};

    // Radial density r⁴ e^{-r}: <r> = 5, <r²> = 30
    const auto pts = generate_orbital_samples(qs, 50000, 1.0, rng, facts, DensityModel::Real);
    REQUIRE(pts.size() == 50000);
    REQUIRE(mean_radius(pts) == Approx(5.0).epsilon(0.10));
    REQUIRE(mean_r2(pts) == Approx(30.0).epsilon(0.20));

    SECTION("pz lobes lie along z") {
        double zz = 0.0, xx = 0.0;
        for (const auto& p : pts) {
            zz += p.z() * p.z();
            xx += p.x() * p.x();
        }
        // <z²> = 3 <x²> for cos²θ angular weight
        REQUIRE(zz > 2.0 * xx);
    }

    SECTION("sharpness 2 tightens the cloud") {
        const auto sharp = generate_orbital_samples(qs, 20000, 2.0, rng, facts, DensityModel::Real);
        REQUIRE(mean_radius(sharp) < mean_radius(pts));
    }
}

TEST_CASE("generate_orbital_samples: 2p radial distribution", "[sampler][statistics]") {
    FactorialTable facts;
    const QuantumState qs{2, 1, 0, 1.0};

    REQUIRE(radial_cdf_2p(0.0) == Approx(0.0).margin(1e-15));
    REQUIRE(radial_cdf_2p(4.0) == Approx(0.3711630648).epsilon(1e-8));

    // Markov correlation inflates D well beyond the i.i.d. 1.36/sqrt(N) ≈ 0.006
    SECTION("Real model") {
        std::mt19937_64 rng(777);
        const auto pts = generate_orbital_samples(qs, 50000, 1.0, rng, facts, DensityModel::Real);
        REQUIRE(ks_distance(pts, radial_cdf_2p) < 0.04);
    }

    SECTION("Complex model") {
        std::mt19937_64 rng(778);
        const auto pts = generate_orbital_samples(qs, 50000, 1.0, rng, facts, DensityModel::Complex);
        REQUIRE(ks_distance(pts, radial_cdf_2p) < 0.04);
    }

    SECTION("Sharpness 2 is a different distribution") {
        std::mt19937_64 rng(779);
        const auto pts = generate_orbital_samples(qs, 50000, 2.0, rng, facts, DensityModel::Real);
        REQUIRE(ks_distance(pts, radial_cdf_2p) > 0.1);
    }
}

TEST_CASE("generate_orbital_samples: rejects invalid input", "[sampler]") {
    FactorialTable facts;
    std::mt19937_64 rng(0);
    REQUIRE_THROWS_AS(generate_orbital_samples({2, 2, 0, 1.0}, 10, 2.0, rng, facts),
                      std::invalid_argument);
    REQUIRE_THROWS_AS(generate_orbital_samples({1, 0, 0, 1.0}, 10, 0.0, rng, facts),
                      std::invalid_argument);
    REQUIRE(generate_orbital_samples({1, 0, 0, 1.0}, 0, 2.0, rng, facts).empty());
}

// -----------------------------------------------------------------------------
// Session context
// -----------------------------------------------------------------------------
TEST_CASE("SamplingContext: session stream", "[sampler][context]") {
    const QuantumState qs{2, 1, 1, 1.0};

    SECTION("continues one stream across calls") {
        SamplingContext ctx(42);
        const auto first = ctx.generate(qs, 300, 2.0);
        const auto second = ctx.generate(qs, 300, 2.0);
        REQUIRE(first.size() == 300);
        REQUIRE_FALSE(first == second);

        ctx.reseed(42);
        REQUIRE(ctx.generate(qs, 300, 2.0) == first);
    }

    SECTION("concurrent calls receive whole slices of the stream") {
        SamplingContext ref(42);
        const auto s1 = ref.generate(qs, 2000, 2.0);
        const auto s2 = ref.generate(qs, 2000, 2.0);

        SamplingContext shared(42);
        SampleBatch a, b;
        std::thread ta([&] { a = shared.generate(qs, 2000, 2.0); });
        std::thread tb([&] { b = shared.generate(qs, 2000, 2.0); });
        ta.join();
        tb.join();

        // Either thread may go first; neither may interleave with the other
        const bool in_order = (a == s1 && b == s2);
        const bool swapped  = (a == s2 && b == s1);
        REQUIRE((in_order || swapped));
    }

    SECTION("invalid input throws and leaves the context usable") {
        SamplingContext ctx(7);
        REQUIRE_THROWS_AS(ctx.generate({1, 1, 0, 1.0}, 10, 2.0), std::invalid_argument);
        REQUIRE(ctx.generate(qs, 10, 2.0).size() == 10);
        REQUIRE(ctx.factorials().size() > 2);
    }
}

// -----------------------------------------------------------------------------
// Orbital colors
// -----------------------------------------------------------------------------
TEST_CASE("orbital_color: fixed palette", "[color]") {
    REQUIRE(orbital_color(1, 0, 0) == Rgb{1.0f, 1.0f, 1.0f});
    REQUIRE(orbital_color(2, 0, 0) == Rgb{0.0f, 1.0f, 0.0f});
    REQUIRE(orbital_color(2, 1, 0) == Rgb{1.0f, 1.0f, 0.0f});
    REQUIRE(orbital_color(2, 1, 1) == Rgb{0.0f, 1.0f, 1.0f});
    REQUIRE(orbital_color(2, 1, -1) == Rgb{0.0f, 0.0f, 1.0f});
}

TEST_CASE("orbital_color: generated hues", "[color]") {
    const Rgb d0 = orbital_color(3, 2, 0);
    const Rgb d1 = orbital_color(3, 2, 1);
    REQUIRE_FALSE(d0 == d1);

    for (int n = 3; n <= 7; ++n) {
        for (int l = 0; l < n && l < 4; ++l) {
            for (int m = -l; m <= l; ++m) {
                const Rgb c = orbital_color(n, l, m);
                for (float v : {c.r, c.g, c.b}) {
                    REQUIRE(v >= 0.0f);
                    REQUIRE(v <= 1.0f);
                }
            }
        }
    }

    SECTION("HSL primaries") {
        const Rgb red = hsl_to_rgb(0.0, 1.0, 0.5);
        REQUIRE(red.r == Approx(1.0));
        REQUIRE(red.g == Approx(0.0).margin(1e-6));
        REQUIRE(red.b == Approx(0.0).margin(1e-6));

        const Rgb green = hsl_to_rgb(1.0 / 3.0, 1.0, 0.5);
        REQUIRE(green.g == Approx(1.0));
        REQUIRE(green.r == Approx(0.0).margin(1e-6));

        const Rgb grey = hsl_to_rgb(0.7, 0.0, 0.25);
        REQUIRE(grey == Rgb{0.25f, 0.25f, 0.25f});
    }
}

// -----------------------------------------------------------------------------
// Whole atom
// -----------------------------------------------------------------------------
TEST_CASE("sample_atom: carbon layout", "[atom]") {
    FactorialTable facts;
    AtomSamplingOptions opt;
    opt.seed = 7;

    const auto cloud = sample_atom(6, 100, facts, opt);
    REQUIRE(cloud.Z == 6);
    REQUIRE(cloud.orbitals.size() == 4);
    REQUIRE(cloud.size() == 600);
    REQUIRE(cloud.colors.size() == cloud.size());
    REQUIRE(cloud.offsets == std::vector<std::size_t>{0, 200, 400, 500, 600});

    // Budget proportional to occupancy
    REQUIRE(cloud.orbital_size(0) == 200);
    REQUIRE(cloud.orbital_size(2) == 100);

    SECTION("orbital_index") {
        REQUIRE(cloud.orbital_index(0) == 0);
        REQUIRE(cloud.orbital_index(199) == 0);
        REQUIRE(cloud.orbital_index(200) == 1);
        REQUIRE(cloud.orbital_index(450) == 2);
        REQUIRE(cloud.orbital_index(599) == 3);
        REQUIRE_THROWS_AS(cloud.orbital_index(600), std::out_of_range);
    }

    SECTION("colors follow the emitting orbital") {
        REQUIRE(cloud.colors[0] == orbital_color(1, 0, 0));
        REQUIRE(cloud.colors[250] == orbital_color(2, 0, 0));
        REQUIRE(cloud.colors[400] == orbital_color(2, 1, 0));
        REQUIRE(cloud.colors[599] == orbital_color(2, 1, 1));
    }
}

TEST_CASE("sample_atom: seeding", "[atom]") {
    FactorialTable facts;
    AtomSamplingOptions opt;
    opt.seed = 2024;

    const auto a = sample_atom(8, 50, facts, opt);
    const auto b = sample_atom(8, 50, facts, opt);
    REQUIRE(a.positions == b.positions);

    opt.seed = 2025;
    const auto c = sample_atom(8, 50, facts, opt);
    REQUIRE_FALSE(a.positions == c.positions);

#ifdef _OPENMP
    SECTION("independent of thread count") {
        opt.seed = 2024;
        const int saved = omp_get_max_threads();
        omp_set_num_threads(1);
        const auto serial = sample_atom(8, 50, facts, opt);
        omp_set_num_threads(saved);
        REQUIRE(serial.positions == a.positions);
    }
#endif
}

TEST_CASE("sample_atom: filters and empty input", "[atom]") {
    FactorialTable facts;
    AtomSamplingOptions opt;
    opt.seed = 1;

    SECTION("hidden subshells are skipped") {
        opt.hidden_subshells = {"1s", "2s"};
        const auto cloud = sample_atom(6, 10, facts, opt);
        REQUIRE(cloud.orbitals.size() == 2);
        REQUIRE(cloud.size() == 20);
        for (const auto& o : cloud.orbitals) REQUIRE(o.l == 1);
    }

    SECTION("zero budget keeps the orbital list") {
        const auto cloud = sample_atom(6, 0, facts, opt);
        REQUIRE(cloud.empty());
        REQUIRE(cloud.orbitals.size() == 4);
        REQUIRE(cloud.offsets == std::vector<std::size_t>{0, 0, 0, 0, 0});
        REQUIRE_THROWS_AS(cloud.orbital_index(0), std::out_of_range);
    }

    SECTION("no electrons") {
        const auto cloud = sample_atom(0, 100, facts, opt);
        REQUIRE(cloud.empty());
        REQUIRE(cloud.orbitals.empty());
        REQUIRE(cloud.offsets == std::vector<std::size_t>{0});
    }
}

TEST_CASE("sample_atom: invalid options throw", "[atom]") {
    FactorialTable facts;
    AtomSamplingOptions opt;

    SECTION("step_factor") {
        opt.step_factor = 0.0;
        REQUIRE_THROWS_AS(sample_atom(1, 10, facts, opt), std::invalid_argument);
    }
    SECTION("length_scale") {
        opt.length_scale = -1.0;
        REQUIRE_THROWS_AS(sample_atom(1, 10, facts, opt), std::invalid_argument);
    }
    SECTION("burn_in") {
        opt.burn_in = -3;
        REQUIRE_THROWS_AS(sample_atom(1, 10, facts, opt), std::invalid_argument);
    }
}

TEST_CASE("sample_atom: length scale stretches the cloud", "[atom][statistics]") {
    FactorialTable facts;
    AtomSamplingOptions opt;
    opt.seed = 5;
    opt.burn_in = 500;

    // Hydrogen 1s: <r> = 1.5 Bohr
    const auto base = sample_atom(1, 20000, facts, opt);
    REQUIRE(mean_radius(base.positions) == Approx(1.5).epsilon(0.10));

    opt.length_scale = 2.0;
    const auto wide = sample_atom(1, 20000, facts, opt);
    REQUIRE(mean_radius(wide.positions) == Approx(3.0).epsilon(0.10));
}
