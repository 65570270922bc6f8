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

#include <glm/vec3.hpp>

#include <string>

/**
 * @file vector_math.h
 * @brief Vector algebra and Euler rotation primitives for the render pipeline
 *
 * Thin, value-returning wrappers over glm double-precision vectors. Every
 * function is pure: arguments are never modified and a new value is returned.
 *
 * Rotation convention: right-handed rotations about the local axis through the
 * origin. rotate_euler() applies X, then Y, then Z. The order is part of the
 * contract (scene files and camera angles depend on it).
 */

namespace facet {

/// Double-precision 3D vector (positions, directions, normals, Euler angles, scale)
using Vec3 = glm::dvec3;

/**
 * @brief Projected vertex in screen space
 *
 * Screen Y grows downward. `scale` is the perspective factor used for the
 * projection and `z` is the camera-space depth of the source vertex.
 */
struct ScreenPoint {
    double x = 0.0;
    double y = 0.0;
    double scale = 1.0;
    double z = 0.0;
};

namespace math {

/**
 * @brief Axis set for constraining transform deltas
 *
 * Components outside the named set are zeroed. NONE leaves the delta untouched.
 */
enum class AxisConstraint { X, Y, Z, XY, XZ, YZ, NONE };

Vec3 add(const Vec3& a, const Vec3& b);
Vec3 subtract(const Vec3& a, const Vec3& b);
Vec3 multiply(const Vec3& v, double s);
Vec3 divide(const Vec3& v, double s);

/// Componentwise product (used for object scale)
Vec3 multiply_components(const Vec3& a, const Vec3& b);

double dot(const Vec3& a, const Vec3& b);
Vec3 cross(const Vec3& a, const Vec3& b);
double length(const Vec3& v);

/**
 * @brief Unit vector in the direction of v
 *
 * @return Zero vector when v has exactly zero length (never divides by zero)
 */
Vec3 normalize(const Vec3& v);

Vec3 rotate_x(const Vec3& v, double angle);
Vec3 rotate_y(const Vec3& v, double angle);
Vec3 rotate_z(const Vec3& v, double angle);

/**
 * @brief Rotate by Euler angles (radians), X then Y then Z
 *
 * Not commutative. rotate_euler(rotate_euler(v, r), -r) is NOT an inverse in
 * general; use the per-axis rotations in reverse order for that.
 */
Vec3 rotate_euler(const Vec3& v, const Vec3& rotation);

double lerp(double a, double b, double t);
Vec3 lerp(const Vec3& a, const Vec3& b, double t);

double clamp(double value, double min_value, double max_value);

/**
 * @brief Round value to the nearest multiple of grid_size (halves round up)
 *
 * A non-positive grid size disables snapping and returns the value unchanged.
 */
double snap_to_grid(double value, double grid_size);

/// Snap every component of v to the grid
Vec3 snap_to_grid(const Vec3& v, double grid_size);

Vec3 constrain_to_axis(const Vec3& delta, AxisConstraint axis);

/**
 * @brief Parse an axis-set name ("x", "y", "z", "xy", "xz", "yz", "none")
 * @return Parsed constraint, NONE for unrecognized names
 */
AxisConstraint parse_axis_constraint(const std::string& name);

const char* axis_constraint_name(AxisConstraint axis);

// Easing curves over t in [0, 1]
double ease_in_out(double t);
double ease_in_cubic(double t);
double ease_out_cubic(double t);

} // namespace math
} // namespace facet
