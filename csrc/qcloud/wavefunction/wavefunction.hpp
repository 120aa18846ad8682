// Copyright 2026 The qcloud Authors
// SPDX-License-Identifier: Apache-2.0

/**
 * @file wavefunction.hpp
 * @brief Hydrogen-like wavefunction evaluator (complex and real orbitals).
 *
 * ψ(r,θ,φ) = R_{nl}(r) · Y(θ,φ), atomic units, nucleus at the origin.
 *
 * Radial part (ρ = 2 Z_eff r / n):
 *   R_{nl} = sqrt((2Z_eff/n)³ (n-l-1)! / (2n (n+l)!)) e^{-ρ/2} ρ^l L_{n-l-1}^{2l+1}(ρ)
 *
 * Angular part:
 *   Complex: |Y_l^m| = N_lm |P_l^{|m|}(cos θ)|, φ-independent
 *   Real:    Cartesian combinations in direction cosines (s, p, d);
 *            l > 2 falls back to the s constant (known limitation,
 *            no f-orbital lobes)
 *
 * Real p convention: m=0 → z, m=+1 → x, m=-1 → y.
 * Real d convention: m=0 → z², ±1 → xz/yz, +2 → x²-y², -2 → xy.
 *
 * Densities are not normalized over space beyond what R and Y carry;
 * the sampler only uses ratios.
 *
 * Date: October, 2026
 */

#pragma once

#include <qcloud/special/special_functions.hpp>
#include <qcloud/utils/types.hpp>
#include <qcloud/wavefunction/quantum_state.hpp>

#include <cstdint>
#include <string>

namespace qcloud {

/**
 * Which angular basis a density is evaluated in.
 *
 * Complex: |ψ_nlm|², azimuthally symmetric (rings for m ≠ 0)
 * Real   : ψ_real², directional lobes for p/d
 */
enum class DensityModel : std::uint8_t {
    Complex,
    Real
};

/**
 * @brief Parse "complex" / "real".
 * @throws std::invalid_argument Unknown name
 */
[[nodiscard]] DensityModel parse_density_model(const std::string& s);

/**
 * @class WaveFunction
 * @brief Immutable evaluator bound to one QuantumState.
 *
 * Normalization constants are computed once at construction, so the
 * per-point evaluation never touches the factorial table. Safe to share
 * across threads after construction.
 */
class WaveFunction {
public:
    /**
     * @param qs    Orbital (assumed valid, see QuantumState::validate)
     * @param facts Factorial memo used for the normalization constants
     */
    WaveFunction(const QuantumState& qs, FactorialTable& facts);

    [[nodiscard]] const QuantumState& state() const noexcept { return qs_; }

    /// Radial function R_{nl}(r) (signed)
    [[nodiscard]] double radial(double r) const noexcept;

    /// |ψ_nlm|² for the complex eigenstate; 0 for r < R_MIN
    [[nodiscard]] double complex_density(const Point3& p) const noexcept;

    /// Signed real-orbital amplitude; 0 for r < R_MIN
    [[nodiscard]] double real_amplitude(const Point3& p) const noexcept;

    /// real_amplitude(p)²
    [[nodiscard]] double real_density(const Point3& p) const noexcept {
        const double psi = real_amplitude(p);
        return psi * psi;
    }

    /// Dispatch on model
    [[nodiscard]] double density(const Point3& p, DensityModel model) const noexcept {
        return model == DensityModel::Complex ? complex_density(p) : real_density(p);
    }

private:
    /// Real angular factor from direction cosines
    [[nodiscard]] double real_angular(double dx, double dy, double dz) const noexcept;

    QuantumState qs_;
    double radial_norm_ = 0.0;  ///< sqrt((2Z/n)³ (n-l-1)! / (2n (n+l)!))
    double ylm_norm_    = 0.0;  ///< sqrt((2l+1)/(4π) (l-|m|)!/(l+|m|)!)
};

// ============================================================================
// Point-wise entry points
// ============================================================================

/// |ψ_nlm(x,y,z)|², complex-orbital variant
[[nodiscard]] double probability_density(double x, double y, double z,
                                         const QuantumState& qs,
                                         FactorialTable& facts);

/// |ψ_nlm(p)|², complex-orbital variant
[[nodiscard]] double probability_density(const Point3& p,
                                         const QuantumState& qs,
                                         FactorialTable& facts);

/// Signed real-orbital amplitude ψ(x,y,z)
[[nodiscard]] double real_wavefunction(double x, double y, double z,
                                       const QuantumState& qs,
                                       FactorialTable& facts);

/// real_wavefunction(x,y,z)²
[[nodiscard]] double real_probability_density(double x, double y, double z,
                                              const QuantumState& qs,
                                              FactorialTable& facts);

} // namespace qcloud
