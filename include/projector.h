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

/**
 * @file projector.h
 * @brief Camera space to 2D screen space perspective projection
 *
 * The camera sits at z = -camera_distance looking down +Z. The canvas origin is
 * the top-left corner, so world +Y maps to screen up.
 */

namespace facet {

/// Depths at or below this are clamped to avoid the divide blowing up
constexpr double MIN_EFFECTIVE_DEPTH = 10.0;

/**
 * @brief Perspective scale factor for a camera-space depth
 *
 * effective = z + camera_distance; fov / effective when effective > 10,
 * otherwise fov / 10.
 */
double projection_scale(double z, double fov, double camera_distance);

/**
 * @brief Project a camera-space point to screen space
 *
 * No near-plane clipping is done; points behind the camera still project
 * using the clamped scale.
 *
 * @param v Camera-space point
 * @param width Canvas width in pixels
 * @param height Canvas height in pixels
 * @param fov Focal length in pixels
 * @param camera_distance Dolly distance
 * @return Screen point carrying the scale and the source z
 */
ScreenPoint project(const Vec3& v, double width, double height, double fov,
                    double camera_distance);

} // namespace facet
