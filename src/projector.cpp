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

#include "projector.h"

namespace facet {

double projection_scale(double z, double fov, double camera_distance) {
    double effective_depth = z + camera_distance;
    if (effective_depth > MIN_EFFECTIVE_DEPTH) {
        return fov / effective_depth;
    }
    return fov / MIN_EFFECTIVE_DEPTH;
}

ScreenPoint project(const Vec3& v, double width, double height, double fov,
                    double camera_distance) {
    ScreenPoint result;

    // Perspective scale (similar triangles)
    result.scale = projection_scale(v.z, fov, camera_distance);

    // Centre in canvas, Y flipped for screen coordinates
    result.x = v.x * result.scale + width / 2.0;
    result.y = -v.y * result.scale + height / 2.0;
    result.z = v.z;

    return result;
}

} // namespace facet
