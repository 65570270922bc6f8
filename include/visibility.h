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

#include "vector_math.h"

#include <vector>

/**
 * @file visibility.h
 * @brief Face normals, centroids and backface culling in camera space
 */

namespace facet {

/**
 * Facing-ratio tolerance. A face survives when dot(normal, view) <= epsilon,
 * so faces slightly past edge-on are still drawn (avoids silhouette cracks).
 */
constexpr double DEFAULT_VISIBILITY_EPSILON = 0.15;

/**
 * @brief Unit normal from the first three vertices: (v1 - v0) x (v2 - v0)
 * @return {0, 0, 1} when fewer than three vertices are given
 */
Vec3 calculate_normal(const std::vector<Vec3>& vertices);

/// Arithmetic mean of the vertices (zero vector for an empty loop)
Vec3 calculate_center(const std::vector<Vec3>& vertices);

/**
 * @brief Flip `normal` if it points toward `anchor`
 *
 * Negates the normal when dot(normal, centroid - anchor) < 0. A zero dot
 * product leaves it unchanged.
 */
Vec3 orient_outward(const Vec3& normal, const Vec3& centroid, const Vec3& anchor);

/// normalize(centroid + (0, 0, camera_distance)): eye → face direction
Vec3 view_direction(const Vec3& centroid, double camera_distance);

double facing_ratio(const Vec3& normal, const Vec3& centroid, double camera_distance);

/// Inclusive test: facing <= epsilon
bool passes_backface_test(double facing, double epsilon = DEFAULT_VISIBILITY_EPSILON);

/**
 * @brief Backface culling
 *
 * @param normal Outward camera-space normal
 * @param centroid Camera-space face centroid
 * @param camera_distance Dolly distance (camera sits at z = -camera_distance)
 * @param epsilon Facing tolerance
 * @return true if the face should be drawn
 */
bool is_face_visible(const Vec3& normal, const Vec3& centroid, double camera_distance,
                     double epsilon = DEFAULT_VISIBILITY_EPSILON);

} // namespace facet
