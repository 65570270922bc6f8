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

namespace facet {

/// Depth key: camera-space Z of the centroid (larger = farther from the camera)
double face_depth(const std::vector<Vec3>& camera_vertices);

/**
 * @brief Sort faces back-to-front for painter's algorithm
 *
 * Farthest (largest depth) first. Stable: equal depths keep their input order,
 * which is object order then generator order.
 */
void sort_faces_by_depth(std::vector<ProjectedFace>& faces);

} // namespace facet
