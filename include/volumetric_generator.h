// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2025 Facet Contributors
 *
 * This file is part of Facet, which is free software: you can
 * redistribute it and/or modify it under the terms of the GNU General
 * Public License as published by the Free Software Foundation, either
 * version 3 of the License, or (at your option) any later version.
 *
 * See <https://www.gnu.org/licenses/>.
 */

#pragma once

#include "scene_types.h"

#include <vector>

/**
 * @file volumetric_generator.h
 * @brief Time-animated "volumetric" primitives
 *
 * These are visual approximations, not simulations:
 *
 * - Metaballs: a sum-of-inverse-square field over a few moving blobs is
 *   sampled on a coarse grid. Each grid cell straddling the isosurface emits
 *   one quad, oriented along the dominant gradient axis. This is NOT marching
 *   cubes; the result is a blocky proxy of the implicit surface.
 * - Fluid blob: a cluster of sphere puffs orbiting the origin.
 * - Cloud volume: a cluster of flattened ellipsoid puffs drifting with time.
 *
 * All positions and radii are continuous functions of (time, per-particle
 * phase), so animation is smooth and every call is deterministic.
 *
 * PERFORMANCE: the metaball field is sampled O(grid^3) times per object per
 * frame with no caching.
 */

namespace facet {
namespace mesh {

constexpr int METABALL_COUNT = 4;
constexpr int METABALL_GRID_SIZE = 12;     ///< Cells per axis
constexpr double METABALL_THRESHOLD = 1.0; ///< Field >= threshold is inside
constexpr int FLUID_PARTICLE_COUNT = 6;
constexpr int CLOUD_PUFF_COUNT = 7;
constexpr int PUFF_SEGMENTS = 8;

struct MetaballBlob {
    Vec3 center;
    double radius;
};

/// Spherical or ellipsoidal puff of a particle cluster
struct Puff {
    Vec3 center;
    Vec3 radii;
};

/**
 * @brief Blob centres and radii at the given time
 *
 * Blob i has phase 2*pi*i/METABALL_COUNT and stays within 0.35*size of the
 * origin.
 */
std::vector<MetaballBlob> metaball_blobs(double size, double time);

/**
 * @brief Evaluate sum(radius^2 / distance^2) at point p
 *
 * Squared distances are floored at a tiny epsilon so a sample exactly on a
 * blob centre stays finite.
 */
double metaball_field(const Vec3& p, const std::vector<MetaballBlob>& blobs);

/**
 * @brief Blocky isosurface quads over a grid_size^3 lattice spanning [-size, size]^3
 */
std::vector<Face> generate_metaballs(double size = 50.0, double time = 0.0,
                                     int grid_size = METABALL_GRID_SIZE);

std::vector<Puff> fluid_particles(double size, double time);
std::vector<Face> generate_fluid_blob(double size = 50.0, double time = 0.0);

std::vector<Puff> cloud_puffs(double size, double time);
std::vector<Face> generate_cloud_volume(double size = 50.0, double time = 0.0);

} // namespace mesh
} // namespace facet
