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
 * @file mesh_generator.h
 * @brief Procedural face lists for the parametric primitives
 *
 * Every generator is a pure function of its parameters. Faces come back in
 * object-local space, centred on the origin, with outward winding: the raw
 * normal (v1 - v0) x (v2 - v0) points away from the face's anchor. Renderer
 * normal correction exists only as a fallback.
 *
 * Volumetric kinds (metaballs, fluid blob, cloud volume) live in
 * volumetric_generator.h and are dispatched from generate_primitive_faces().
 */

namespace facet {
namespace mesh {

constexpr double DEFAULT_PRIMITIVE_SIZE = 50.0;
constexpr int DEFAULT_SEGMENTS = 16;
constexpr int MIN_SEGMENTS = 3;

/**
 * @brief HSL colour ramp for cosmetic per-face gradients
 *
 * Hue grows with the longitude/segment fraction, lightness with the
 * latitude fraction. Not used for physical shading.
 */
struct HslRamp {
    double hue_base;
    double hue_span;
    double saturation;
    double lightness_base;
    double lightness_span;
};

/// Format an "hsl(h, s%, l%)" colour string
std::string hsl_color(double hue, double saturation, double lightness);

/**
 * @brief Axis-aligned cube: 8 corners, 6 quads
 * @param size Edge length; every vertex coordinate has magnitude size/2
 */
std::vector<Face> generate_box(double size = DEFAULT_PRIMITIVE_SIZE);

/**
 * @brief UV sphere: quads for interior bands, triangles at the poles
 * @param segments Number of latitude bands and longitude slices
 */
std::vector<Face> generate_sphere(double radius = DEFAULT_PRIMITIVE_SIZE,
                                  int segments = DEFAULT_SEGMENTS);

/**
 * @brief Ellipsoid centred at `center` with per-axis radii
 *
 * Same band layout as generate_sphere(); anchors every face at `center`.
 */
std::vector<Face> generate_ellipsoid(const Vec3& center, const Vec3& radii, int segments,
                                     const HslRamp& ramp);

/// Side quads plus triangle-fan caps around the Y axis
std::vector<Face> generate_cylinder(double radius = 30.0, double height = 80.0,
                                    int segments = DEFAULT_SEGMENTS);

/**
 * @brief Ring torus around the Y axis
 *
 * Each quad is emitted in reverse of the naive (theta, phi) order. The naive
 * order winds inward; the reversal is what makes the raw normal leave the tube.
 */
std::vector<Face> generate_torus(double major_radius = 40.0, double minor_radius = 15.0,
                                 int segments = DEFAULT_SEGMENTS);

/// Apex at +height/2, base ring at -height/2; no top cap
std::vector<Face> generate_cone(double radius = 40.0, double height = 80.0,
                                int segments = DEFAULT_SEGMENTS);

/// Square-based pyramid: four side triangles plus the base quad
std::vector<Face> generate_pyramid(double size = DEFAULT_PRIMITIVE_SIZE, double height = 70.0);

/**
 * @brief Dispatch on primitive kind
 *
 * Size mapping follows the editor's proportions: sphere radius = size,
 * cylinder (0.6, 1.6)*size, torus (0.8, 0.3)*size, cone (0.8, 1.6)*size,
 * pyramid (1.0, 1.4)*size. `time` is consumed only by volumetric kinds.
 * Unrecognized kinds fall back to the box.
 */
std::vector<Face> generate_primitive_faces(PrimitiveKind kind,
                                           double size = DEFAULT_PRIMITIVE_SIZE,
                                           double time = 0.0);

} // namespace mesh
} // namespace facet
