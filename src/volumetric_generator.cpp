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

#include "volumetric_generator.h"

#include "mesh_generator.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <iterator>
#include <utility>

namespace {

constexpr double TWO_PI = 2.0 * M_PI;

// Floor for squared distances in the field (keeps centre samples finite)
constexpr double FIELD_MIN_DIST_SQ = 1e-6;

// Blob motion, as fractions of the primitive size
constexpr double METABALL_ORBIT_XZ = 0.35;
constexpr double METABALL_ORBIT_Y = 0.25;
constexpr double METABALL_RADIUS = 0.3;

// Colour ramps
constexpr double METABALL_HUE_BOTTOM = 10.0; // Deep orange
constexpr double METABALL_HUE_SPAN = 40.0;   // Toward yellow at the top
constexpr facet::mesh::HslRamp FLUID_RAMP = {195.0, 35.0, 90.0, 45.0, 20.0};
constexpr facet::mesh::HslRamp CLOUD_RAMP = {210.0, 10.0, 30.0, 95.0, -15.0};

// Flattening of cloud puffs along Y
constexpr double CLOUD_FLATTEN_Y = 0.6;

} // anonymous namespace

namespace facet {
namespace mesh {

// ============================================================================
// Metaballs
// ============================================================================

std::vector<MetaballBlob> metaball_blobs(double size, double time) {
    std::vector<MetaballBlob> blobs;
    blobs.reserve(METABALL_COUNT);

    for (int i = 0; i < METABALL_COUNT; i++) {
        double phase = (static_cast<double>(i) / METABALL_COUNT) * TWO_PI;

        MetaballBlob blob;
        blob.center = Vec3(size * METABALL_ORBIT_XZ * std::sin(time * 0.9 + phase),
                           size * METABALL_ORBIT_Y * std::cos(time * 0.7 + phase * 1.3),
                           size * METABALL_ORBIT_XZ * std::cos(time * 0.8 + phase));
        blob.radius = size * METABALL_RADIUS * (0.8 + 0.2 * std::sin(time * 1.1 + phase));
        blobs.push_back(blob);
    }

    return blobs;
}

double metaball_field(const Vec3& p, const std::vector<MetaballBlob>& blobs) {
    double sum = 0.0;
    for (const auto& blob : blobs) {
        Vec3 d = p - blob.center;
        double dist_sq = std::max(d.x * d.x + d.y * d.y + d.z * d.z, FIELD_MIN_DIST_SQ);
        sum += (blob.radius * blob.radius) / dist_sq;
    }
    return sum;
}

std::vector<Face> generate_metaballs(double size, double time, int grid_size) {
    if (grid_size < 1) {
        spdlog::warn("[Mesh Generator] Invalid metaball grid size {}, using {}", grid_size,
                     METABALL_GRID_SIZE);
        grid_size = METABALL_GRID_SIZE;
    }

    const std::vector<MetaballBlob> blobs = metaball_blobs(size, time);
    const double cell = (2.0 * size) / grid_size;
    const double half = cell / 2.0;
    const int samples_per_axis = grid_size + 1;

    // Sample the field once per lattice corner (shared by up to 8 cells)
    std::vector<double> samples(static_cast<size_t>(samples_per_axis) * samples_per_axis *
                                samples_per_axis);
    auto sample_index = [samples_per_axis](int i, int j, int k) {
        return (static_cast<size_t>(i) * samples_per_axis + j) * samples_per_axis + k;
    };
    for (int i = 0; i < samples_per_axis; i++) {
        for (int j = 0; j < samples_per_axis; j++) {
            for (int k = 0; k < samples_per_axis; k++) {
                Vec3 p(-size + i * cell, -size + j * cell, -size + k * cell);
                samples[sample_index(i, j, k)] = metaball_field(p, blobs);
            }
        }
    }

    // In-plane axes per dominant axis, ordered so that u x v = +axis
    const Vec3 axis_unit[3] = {Vec3(1.0, 0.0, 0.0), Vec3(0.0, 1.0, 0.0), Vec3(0.0, 0.0, 1.0)};
    const int u_axis[3] = {1, 2, 0};
    const int v_axis[3] = {2, 0, 1};

    std::vector<Face> faces;

    for (int i = 0; i < grid_size; i++) {
        for (int j = 0; j < grid_size; j++) {
            for (int k = 0; k < grid_size; k++) {
                bool any_inside = false;
                bool any_outside = false;
                for (int corner = 0; corner < 8; corner++) {
                    double value = samples[sample_index(i + (corner & 1), j + ((corner >> 1) & 1),
                                                        k + ((corner >> 2) & 1))];
                    if (value >= METABALL_THRESHOLD) {
                        any_inside = true;
                    } else {
                        any_outside = true;
                    }
                }
                if (!any_inside || !any_outside) {
                    continue;
                }

                Vec3 center(-size + (i + 0.5) * cell, -size + (j + 0.5) * cell,
                            -size + (k + 0.5) * cell);

                // Central-difference gradient at the cell centre
                double gradient[3];
                for (int axis = 0; axis < 3; axis++) {
                    Vec3 offset = axis_unit[axis] * half;
                    gradient[axis] = (metaball_field(center + offset, blobs) -
                                      metaball_field(center - offset, blobs)) /
                                     cell;
                }

                int dominant = 0;
                for (int axis = 1; axis < 3; axis++) {
                    if (std::fabs(gradient[axis]) > std::fabs(gradient[dominant])) {
                        dominant = axis;
                    }
                }
                if (gradient[dominant] == 0.0) {
                    continue;
                }

                // Field falls off outward, so the surface faces down the gradient
                bool faces_positive = gradient[dominant] < 0.0;
                Vec3 outward = axis_unit[dominant] * (faces_positive ? 1.0 : -1.0);
                Vec3 u = axis_unit[u_axis[dominant]] * half;
                Vec3 v = axis_unit[v_axis[dominant]] * half;
                if (!faces_positive) {
                    std::swap(u, v);
                }

                Face face;
                face.vertices = {center - u - v, center + u - v, center + u + v, center - u + v};
                double height = (center.y + size) / (2.0 * size);
                face.color =
                    hsl_color(METABALL_HUE_BOTTOM + METABALL_HUE_SPAN * height, 100.0, 50.0);
                face.anchor = center - outward * cell;
                faces.push_back(std::move(face));
            }
        }
    }

    spdlog::trace("[Mesh Generator] Metaballs t={:.3f}: {} surface quads from {}^3 cells", time,
                  faces.size(), grid_size);
    return faces;
}

// ============================================================================
// Fluid blob
// ============================================================================

std::vector<Puff> fluid_particles(double size, double time) {
    std::vector<Puff> particles;
    particles.reserve(FLUID_PARTICLE_COUNT);

    for (int i = 0; i < FLUID_PARTICLE_COUNT; i++) {
        double phase = (static_cast<double>(i) / FLUID_PARTICLE_COUNT) * TWO_PI;
        double radius = size * (0.22 + 0.06 * std::sin(time * 2.0 + phase));

        Puff particle;
        particle.center = Vec3(size * 0.4 * std::cos(time * 0.6 + phase),
                               size * 0.2 * std::sin(time * 1.3 + 2.0 * phase),
                               size * 0.4 * std::sin(time * 0.6 + phase));
        particle.radii = Vec3(radius, radius, radius);
        particles.push_back(particle);
    }

    return particles;
}

std::vector<Face> generate_fluid_blob(double size, double time) {
    std::vector<Face> faces;
    for (const auto& particle : fluid_particles(size, time)) {
        std::vector<Face> puff = generate_ellipsoid(particle.center, particle.radii,
                                                    PUFF_SEGMENTS, FLUID_RAMP);
        faces.insert(faces.end(), std::make_move_iterator(puff.begin()),
                     std::make_move_iterator(puff.end()));
    }
    return faces;
}

// ============================================================================
// Cloud volume
// ============================================================================

std::vector<Puff> cloud_puffs(double size, double time) {
    std::vector<Puff> puffs;
    puffs.reserve(CLOUD_PUFF_COUNT);

    for (int i = 0; i < CLOUD_PUFF_COUNT; i++) {
        double phase = (static_cast<double>(i) / CLOUD_PUFF_COUNT) * TWO_PI;
        double radius = size * (0.25 + 0.08 * std::sin(time * 0.7 + phase * 1.7));

        Puff puff;
        puff.center = Vec3(size * 0.6 * std::sin(time * 0.25 + phase),
                           size * 0.1 * std::sin(time * 0.5 + phase * 3.0),
                           size * 0.3 * std::cos(time * 0.2 + phase * 2.0));
        puff.radii = Vec3(radius, radius * CLOUD_FLATTEN_Y, radius);
        puffs.push_back(puff);
    }

    return puffs;
}

std::vector<Face> generate_cloud_volume(double size, double time) {
    std::vector<Face> faces;
    for (const auto& puff : cloud_puffs(size, time)) {
        std::vector<Face> shell =
            generate_ellipsoid(puff.center, puff.radii, PUFF_SEGMENTS, CLOUD_RAMP);
        faces.insert(faces.end(), std::make_move_iterator(shell.begin()),
                     std::make_move_iterator(shell.end()));
    }
    return faces;
}

} // namespace mesh
} // namespace facet
