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

#include "depth_sorter.h"

#include "visibility.h"

#include <algorithm>

namespace facet {

double face_depth(const std::vector<Vec3>& camera_vertices) {
    return calculate_center(camera_vertices).z;
}

void sort_faces_by_depth(std::vector<ProjectedFace>& faces) {
    std::stable_sort(faces.begin(), faces.end(),
                     [](const ProjectedFace& a, const ProjectedFace& b) {
                         return a.depth > b.depth;
                     });
}

} // namespace facet
