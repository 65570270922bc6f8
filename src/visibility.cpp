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

#include "visibility.h"

namespace facet {

Vec3 calculate_normal(const std::vector<Vec3>& vertices) {
    if (vertices.size() < 3) {
        return Vec3(0.0, 0.0, 1.0);
    }

    Vec3 edge1 = math::subtract(vertices[1], vertices[0]);
    Vec3 edge2 = math::subtract(vertices[2], vertices[0]);
    return math::normalize(math::cross(edge1, edge2));
}

Vec3 calculate_center(const std::vector<Vec3>& vertices) {
    Vec3 sum(0.0, 0.0, 0.0);
    if (vertices.empty()) {
        return sum;
    }

    for (const auto& v : vertices) {
        sum = math::add(sum, v);
    }
    return math::divide(sum, static_cast<double>(vertices.size()));
}

Vec3 orient_outward(const Vec3& normal, const Vec3& centroid, const Vec3& anchor) {
    if (math::dot(normal, math::subtract(centroid, anchor)) < 0.0) {
        return math::multiply(normal, -1.0);
    }
    return normal;
}

Vec3 view_direction(const Vec3& centroid, double camera_distance) {
    return math::normalize(math::add(centroid, Vec3(0.0, 0.0, camera_distance)));
}

double facing_ratio(const Vec3& normal, const Vec3& centroid, double camera_distance) {
    return math::dot(normal, view_direction(centroid, camera_distance));
}

bool passes_backface_test(double facing, double epsilon) {
    return facing <= epsilon;
}

bool is_face_visible(const Vec3& normal, const Vec3& centroid, double camera_distance,
                     double epsilon) {
    return passes_backface_test(facing_ratio(normal, centroid, camera_distance), epsilon);
}

} // namespace facet
