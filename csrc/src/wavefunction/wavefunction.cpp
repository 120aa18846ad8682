// Copyright 2026 The qcloud Authors
// SPDX-License-Identifier: Apache-2.0

/**
 * @file wavefunction.cpp
 * @brief Radial and angular parts of hydrogen-like orbitals.
 *
 * Date: October, 2026
 */

#include <qcloud/wavefunction/wavefunction.hpp>
#include <qcloud/utils/constants.hpp>
#include <qcloud/utils/log.hpp>

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <stdexcept>

namespace qcloud {

namespace {

// Real spherical harmonic prefactors
const double kNormS   = 1.0 / std::sqrt(4.0 * PI);
const double kNormP   = std::sqrt(3.0 / (4.0 * PI));
const double kNormDz2 = std::sqrt(5.0 / (16.0 * PI));
const double kNormDxz = std::sqrt(15.0 / (4.0 * PI));   // dxz, dyz, dxy
const double kNormDx2 = std::sqrt(15.0 / (16.0 * PI));  // dx²-y²

} // anonymous namespace

DensityModel parse_density_model(const std::string& s) {
    if (s == "complex") return DensityModel::Complex;
    if (s == "real")    return DensityModel::Real;
    throw std::invalid_argument("invalid density model: " + s);
}

// ============================================================================
// WaveFunction
// ============================================================================

WaveFunction::WaveFunction(const QuantumState& qs, FactorialTable& facts) : qs_(qs) {
    const int n = qs_.n;
    const int l = qs_.l;
    const int abs_m = std::abs(qs_.m);

    const double k = 2.0 * qs_.zeff / n;
    radial_norm_ = std::sqrt(k * k * k * facts(n - l - 1) / (2.0 * n * facts(n + l)));
    ylm_norm_ = std::sqrt((2.0 * l + 1.0) / (4.0 * PI) * facts(l - abs_m) / facts(l + abs_m));

    if (l > MAX_REAL_ORBITAL_L) {
        log::debug("WaveFunction: {} has no real-orbital form; real density is spherical",
                   qs_.label());
    }
}

double WaveFunction::radial(double r) const noexcept {
    const int n = qs_.n;
    const int l = qs_.l;
    const double rho = 2.0 * qs_.zeff * r / n;
    return radial_norm_ * std::exp(-0.5 * rho) * std::pow(rho, l)
         * laguerre(n - l - 1, 2.0 * l + 1.0, rho);
}

double WaveFunction::complex_density(const Point3& p) const noexcept {
    const double r = p.norm();
    if (r < R_MIN) return 0.0;

    const double cos_theta = std::clamp(p.z() / r, -1.0, 1.0);
    const double psi = radial(r) * ylm_norm_ * legendre(qs_.l, qs_.m, cos_theta);
    return psi * psi;
}

double WaveFunction::real_amplitude(const Point3& p) const noexcept {
    const double r = p.norm();
    if (r < R_MIN) return 0.0;

    const double inv_r = 1.0 / r;
    return radial(r) * real_angular(p.x() * inv_r, p.y() * inv_r, p.z() * inv_r);
}

double WaveFunction::real_angular(double dx, double dy, double dz) const noexcept {
    switch (qs_.l) {
        case 0:
            return kNormS;
        case 1:
            switch (qs_.m) {
                case  0: return kNormP * dz;
                case  1: return kNormP * dx;
                case -1: return kNormP * dy;
                default: return 0.0;
            }
        case 2:
            switch (qs_.m) {
                case  0: return kNormDz2 * (3.0 * dz * dz - 1.0);
                case  1: return kNormDxz * dx * dz;
                case -1: return kNormDxz * dy * dz;
                case  2: return kNormDx2 * (dx * dx - dy * dy);
                case -2: return kNormDxz * dx * dy;
                default: return 0.0;
            }
        default:
            // TODO: real f combinations (fz³, fxz², ...) would give l = 3 lobes
            return kNormS;
    }
}

// ============================================================================
// Point-wise entry points
// ============================================================================

double probability_density(const Point3& p,
                           const QuantumState& qs, FactorialTable& facts) {
    return WaveFunction(qs, facts).complex_density(p);
}

double probability_density(double x, double y, double z,
                           const QuantumState& qs, FactorialTable& facts) {
    return probability_density(Point3(x, y, z), qs, facts);
}

double real_wavefunction(double x, double y, double z,
                         const QuantumState& qs, FactorialTable& facts) {
    return WaveFunction(qs, facts).real_amplitude(Point3(x, y, z));
}

double real_probability_density(double x, double y, double z,
                                const QuantumState& qs, FactorialTable& facts) {
    const double psi = real_wavefunction(x, y, z, qs, facts);
    return psi * psi;
}

} // namespace qcloud
