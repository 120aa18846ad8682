// Copyright 2026 The qcloud Authors
// SPDX-License-Identifier: Apache-2.0

/**
 * @file types.hpp
 * @brief Platform-independent type aliases and point/color primitives.
 *
 * Coordinates are in Bohr radii (atomic units) throughout the library.
 * Point3 is an Eigen 3-vector so that batches map directly onto (N,3)
 * row-major buffers for the renderer.
 *
 * Date: October, 2026
 */

#pragma once

#include <Eigen/Core>

#include <cstddef>
#include <cstdint>
#include <vector>

namespace qcloud {

// Unsigned integers - Seeds and counters
using u32 = std::uint32_t;
using u64 = std::uint64_t;

// Single precision - Renderer colors
using f32 = float;

/// Cartesian position in Bohr radii
using Point3 = Eigen::Vector3d;

/// Ordered walker positions, one per emitted step
using SampleBatch = std::vector<Point3>;

/**
 * Linear RGB display color in [0,1].
 *
 * Consumed only by the external renderer; float precision matches GPU
 * vertex color buffers.
 */
struct Rgb {
    f32 r = 1.0f;
    f32 g = 1.0f;
    f32 b = 1.0f;

    constexpr bool operator==(const Rgb&) const = default;
};

static_assert(sizeof(double) == 8, "64-bit double required");
static_assert(sizeof(Rgb) == 3 * sizeof(f32), "Rgb must pack as three floats");

} // namespace qcloud
