// Copyright 2026 The qcloud Authors
// SPDX-License-Identifier: Apache-2.0

/**
 * @file bridge.cpp
 * @brief Python-C++ nanobind bridge for qcloud.
 *
 * Provides Python bindings for:
 *  - Point-wise densities (complex / real orbitals)
 *  - Electron configuration with Slater Z_eff
 *  - Single-orbital and whole-atom cloud sampling
 *  - Fine-structure scaling helpers and log verbosity
 *
 * Arrays cross the boundary as NumPy: positions (N,3) float64,
 * colors (N,3) float32, offsets (K+1,) int64.
 *
 * Date: October, 2026
 */

#include <nanobind/nanobind.h>
#include <nanobind/ndarray.h>
#include <nanobind/stl/optional.h>
#include <nanobind/stl/string.h>
#include <nanobind/stl/vector.h>

#include <qcloud/configuration/electron_config.hpp>
#include <qcloud/configuration/periodic_table.hpp>
#include <qcloud/physics/atomic_scales.hpp>
#include <qcloud/sampling/atom_sampler.hpp>
#include <qcloud/sampling/orbital_color.hpp>
#include <qcloud/sampling/sampling_context.hpp>
#include <qcloud/special/special_functions.hpp>
#include <qcloud/utils/log.hpp>
#include <qcloud/wavefunction/wavefunction.hpp>

#include <cstdint>
#include <cstring>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace nb = nanobind;
using namespace nb::literals;

using qcloud::AtomCloud;
using qcloud::SamplingContext;
using qcloud::QuantumState;
using qcloud::Rgb;
using qcloud::SampleBatch;
using qcloud::u64;

// NumPy array type aliases
using PointsOut  = nb::ndarray<double, nb::numpy, nb::shape<-1, 3>>;
using ColorsOut  = nb::ndarray<float, nb::numpy, nb::shape<-1, 3>>;
using I64VecOut  = nb::ndarray<int64_t, nb::numpy, nb::shape<-1>>;
using PointsRO   = nb::ndarray<const double, nb::shape<-1, 3>, nb::c_contig, nb::device::cpu>;
using F64VecOut  = nb::ndarray<double, nb::numpy, nb::shape<-1>>;

// C++ → Python conversion utilities
[[nodiscard]] inline PointsOut from_points(const SampleBatch& pts) {
    const size_t N = pts.size();
    auto* data = new double[N * 3];
    for (size_t i = 0; i < N; ++i) {
        data[3 * i]     = pts[i].x();
        data[3 * i + 1] = pts[i].y();
        data[3 * i + 2] = pts[i].z();
    }
    nb::capsule owner(data, [](void* p) noexcept {
        delete[] static_cast<double*>(p);
    });
    return PointsOut(data, {N, 3}, owner);
}

[[nodiscard]] inline ColorsOut from_colors(const std::vector<Rgb>& cs) {
    const size_t N = cs.size();
    auto* data = new float[N * 3];
    static_assert(sizeof(Rgb) == 3 * sizeof(float));
    if (N > 0) std::memcpy(data, cs.data(), N * sizeof(Rgb));
    nb::capsule owner(data, [](void* p) noexcept {
        delete[] static_cast<float*>(p);
    });
    return ColorsOut(data, {N, 3}, owner);
}

[[nodiscard]] inline I64VecOut from_offsets(const std::vector<size_t>& xs) {
    const size_t N = xs.size();
    auto* data = new int64_t[N];
    for (size_t i = 0; i < N; ++i) data[i] = static_cast<int64_t>(xs[i]);
    nb::capsule owner(data, [](void* p) noexcept {
        delete[] static_cast<int64_t*>(p);
    });
    return I64VecOut(data, {N}, owner);
}

[[nodiscard]] inline nb::list from_orbitals(const std::vector<qcloud::Orbital>& orbs) {
    nb::list out;
    for (const auto& o : orbs) {
        nb::dict d;
        d["n"]         = o.n;
        d["l"]         = o.l;
        d["m"]         = o.m;
        d["occupancy"] = o.occupancy;
        d["zeff"]      = o.zeff;
        d["label"]     = qcloud::subshell_label(o.n, o.l);
        out.append(d);
    }
    return out;
}

// Python → C++: clamp (UI path) or validate (strict path)
[[nodiscard]] inline QuantumState make_state(int n, int l, int m, double zeff, bool clamp) {
    if (clamp) {
        const auto qs = QuantumState::clamped(n, l, m, zeff);
        if (qs.n != n || qs.l != l || qs.m != m) {
            qcloud::log::warn("clamped quantum numbers ({},{},{}) -> ({},{},{})",
                              n, l, m, qs.n, qs.l, qs.m);
        }
        return qs;
    }
    QuantumState qs{n, l, m, zeff};
    qs.validate();
    return qs;
}

// Module definition
NB_MODULE(_qcloud_cpp, m) {
    m.doc() = "qcloud C++ core bridge";

    m.def("set_log_level", &qcloud::log::set_level, "level"_a,
          "Set verbosity: trace, debug, info, warn, error, critical, off.");

    // Sampling context (thread-safe; calls on one ctx serialize)
    nb::class_<SamplingContext>(m, "SamplingContext", "Factorial memo + random generator")
        .def(nb::init<std::optional<u64>>(), "seed"_a = nb::none())
        .def("reseed", &SamplingContext::reseed, "seed"_a)
        .def("cached_factorials", [](SamplingContext& c) { return c.factorials().size(); });

    // Point-wise densities on an (N,3) batch
    m.def("probability_density",
          [](SamplingContext* ctx, PointsRO pts, int n, int l, int mq, double zeff,
             const std::string& model_str, bool clamp) -> F64VecOut {
              const auto qs = make_state(n, l, mq, zeff, clamp);
              const auto model = qcloud::parse_density_model(model_str);
              const qcloud::WaveFunction wf(qs, ctx->factorials());

              const size_t N = pts.shape(0);
              auto* data = new double[N];
              const double* src = pts.data();
              for (size_t i = 0; i < N; ++i) {
                  data[i] = wf.density(
                      qcloud::Point3(src[3 * i], src[3 * i + 1], src[3 * i + 2]), model);
              }
              nb::capsule owner(data, [](void* p) noexcept {
                  delete[] static_cast<double*>(p);
              });
              return F64VecOut(data, {N}, owner);
          },
          "ctx"_a, "points"_a, "n"_a, "l"_a, "m"_a, "zeff"_a = 1.0,
          "model"_a = "complex", "clamp"_a = false,
          "Density |psi|^2 at each row of an (N,3) array.");

    m.def("real_wavefunction",
          [](SamplingContext* ctx, double x, double y, double z, int n, int l, int mq, double zeff) {
              return qcloud::real_wavefunction(x, y, z, make_state(n, l, mq, zeff, false), ctx->factorials());
          },
          "ctx"_a, "x"_a, "y"_a, "z"_a, "n"_a, "l"_a, "m"_a, "zeff"_a = 1.0,
          "Signed real-orbital amplitude.");

    // Configuration
    m.def("electron_configuration",
          [](int Z) { return from_orbitals(qcloud::electron_configuration(Z)); },
          "Z"_a,
          "Occupied orbitals of atom Z with Slater Z_eff.");

    m.def("configuration_string",
          [](int Z) { return qcloud::configuration_string(qcloud::build_subshells(Z)); },
          "Z"_a, "Notation such as '1s2 2s2 2p2'.");

    m.def("element_symbol",
          [](int Z) { return std::string(qcloud::element_symbol(Z)); }, "Z"_a);

    // Single-orbital cloud
    m.def("generate_orbital_samples",
          [](SamplingContext* ctx, int n, int l, int mq, double zeff, size_t count, double sharpness,
             const std::string& model_str, bool clamp) -> PointsOut {
              const auto qs = make_state(n, l, mq, zeff, clamp);
              const auto model = qcloud::parse_density_model(model_str);
              SampleBatch pts;
              {
                  nb::gil_scoped_release release;
                  pts = ctx->generate(qs, count, sharpness, model);
              }
              return from_points(pts);
          },
          "ctx"_a, "n"_a, "l"_a, "m"_a, "zeff"_a, "count"_a,
          "sharpness"_a = 2.0, "model"_a = "real", "clamp"_a = true,
          "Metropolis-Hastings samples of one orbital, shape (count,3).");

    // Whole-atom cloud
    m.def("sample_atom",
          [](SamplingContext* ctx, int Z, int count_per_electron, double sharpness, int burn_in,
             int thinning, double step_factor, double alpha_scale,
             const std::string& model_str, std::optional<u64> seed,
             std::vector<std::string> hidden) -> nb::dict {
              qcloud::AtomSamplingOptions opt;
              opt.sharpness = sharpness;
              opt.burn_in = burn_in;
              opt.thinning = thinning;
              opt.step_factor = step_factor;
              opt.length_scale = qcloud::length_scale_for_alpha(alpha_scale);
              opt.model = qcloud::parse_density_model(model_str);
              opt.seed = seed;
              opt.hidden_subshells = std::move(hidden);

              const auto regime = qcloud::classify_stability(Z, alpha_scale);
              if (regime != qcloud::StabilityRegime::Stable) {
                  qcloud::log::warn("sample_atom: Z={} alpha_scale={} is {}; sampling the "
                                    "nonrelativistic cloud anyway",
                                    Z, alpha_scale, qcloud::to_string(regime));
              }

              AtomCloud cloud;
              {
                  nb::gil_scoped_release release;
                  cloud = qcloud::sample_atom(Z, count_per_electron, ctx->factorials(), opt);
              }

              nb::dict out;
              out["positions"] = from_points(cloud.positions);
              out["colors"]    = from_colors(cloud.colors);
              out["offsets"]   = from_offsets(cloud.offsets);
              out["orbitals"]  = from_orbitals(cloud.orbitals);
              out["stability"] = std::string(qcloud::to_string(regime));
              return out;
          },
          "ctx"_a, "Z"_a, "count_per_electron"_a, "sharpness"_a = 1.0, "burn_in"_a = 200,
          "thinning"_a = 1, "step_factor"_a = 1.5, "alpha_scale"_a = 1.0,
          "model"_a = "real", "seed"_a = nb::none(),
          "hidden_subshells"_a = std::vector<std::string>{},
          "Sample every occupied orbital of atom Z (CSR layout by orbital).");

    m.def("orbital_color",
          [](int n, int l, int mq) {
              const Rgb c = qcloud::orbital_color(n, l, mq);
              return nb::make_tuple(c.r, c.g, c.b);
          },
          "n"_a, "l"_a, "m"_a);

    // Fine-structure scaling
    m.def("stability",
          [](int Z, double alpha_scale) -> nb::dict {
              const auto regime = qcloud::classify_stability(Z, alpha_scale);
              nb::dict out;
              out["regime"]        = std::string(qcloud::to_string(regime));
              out["z_alpha"]       = Z * qcloud::FINE_STRUCTURE * alpha_scale;
              out["binding_ev"]    = qcloud::ground_state_binding_ev(Z, alpha_scale);
              out["length_scale"]  = qcloud::length_scale_for_alpha(alpha_scale);
              return out;
          },
          "Z"_a, "alpha_scale"_a = 1.0,
          "Z*alpha regime and Bohr-model binding under a rescaled alpha.");

    m.def("orbital_extent",
          [](int n, int l) {
              const auto e = qcloud::orbital_extent(n, l);
              return nb::make_tuple(e.expected_radius, e.max_extent, e.max_extent_angstrom());
          },
          "n"_a, "l"_a,
          "(<r>, 1.5<r>) in Bohr and the extent in Angstrom.");
} // NB_MODULE
