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

#include "transform_pipeline.h"

namespace facet {
namespace transform {

Vec3 transform_point(const Vec3& p, const Vec3& position, const Vec3& rotation,
                     const Vec3& scale) {
    Vec3 scaled = math::multiply_components(p, scale);
    Vec3 rotated = math::rotate_euler(scaled, rotation);
    return math::add(rotated, position);
}

Vec3 world_to_camera(const Vec3& p, const Camera& camera) {
    Vec3 panned = math::subtract(p, Vec3(camera.position.x, camera.position.y, 0.0));
    return math::rotate_euler(panned, camera.rotation);
}

std::vector<Vec3> to_world(const std::vector<Vec3>& vertices, const SceneObject& object) {
    std::vector<Vec3> result;
    result.reserve(vertices.size());
    for (const auto& v : vertices) {
        result.push_back(transform_point(v, object.position, object.rotation, object.scale));
    }
    return result;
}

std::vector<Vec3> to_camera(const std::vector<Vec3>& vertices, const Camera& camera) {
    std::vector<Vec3> result;
    result.reserve(vertices.size());
    for (const auto& v : vertices) {
        result.push_back(world_to_camera(v, camera));
    }
    return result;
}

} // namespace transform
} // namespace facet
