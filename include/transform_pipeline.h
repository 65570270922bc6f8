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

#ifndef FACET_TRANSFORM_PIPELINE_H
#define FACET_TRANSFORM_PIPELINE_H

#include "scene_types.h"

#include <vector>

/**
 * @file transform_pipeline.h
 * @brief Coordinate transformation through the render pipeline
 *
 * LOCAL SPACE → WORLD SPACE → CAMERA SPACE
 *
 * Screen space is handled by projector.h. All functions are pure and safe to
 * call from multiple threads.
 */

namespace facet {
namespace transform {

/**
 * @brief Local → world for a single point
 *
 * Order: componentwise scale, then rotate_euler(rotation), then translate.
 *
 * @param p Object-local point
 * @param position Object position (world units)
 * @param rotation Object Euler angles in radians
 * @param scale Per-axis scale factors
 * @return World-space point
 */
Vec3 transform_point(const Vec3& p, const Vec3& position, const Vec3& rotation,
                     const Vec3& scale);

/**
 * @brief World → camera for a single point
 *
 * Subtracts the camera pan (position.x, position.y; Z is left alone because
 * position.z is the dolly distance used by the projector), then applies
 * rotate_euler(camera.rotation).
 */
Vec3 world_to_camera(const Vec3& p, const Camera& camera);

/// Apply transform_point() with the object's transform to every vertex
std::vector<Vec3> to_world(const std::vector<Vec3>& vertices, const SceneObject& object);

/// Apply world_to_camera() to every vertex
std::vector<Vec3> to_camera(const std::vector<Vec3>& vertices, const Camera& camera);

} // namespace transform
} // namespace facet

#endif // FACET_TRANSFORM_PIPELINE_H
