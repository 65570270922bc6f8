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

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

/**
 * @file lighting.h
 * @brief Ambient + Lambertian light accumulation and colour tinting
 *
 * Lighting is evaluated in camera space: directional light vectors are
 * brought into the camera frame by rotating with the negated camera angles.
 * There is no specular term and no shadowing.
 */

namespace facet {

/// Brightness floor applied by apply_lighting_to_color() at zero intensity
constexpr double MIN_BRIGHTNESS = 0.2;

/**
 * @brief RGB color structure for tint calculations
 */
struct Rgb {
    uint8_t r;
    uint8_t g;
    uint8_t b;
};

/**
 * @brief Parse "#rrggbb" or "rrggbb"
 * @return Colour, or std::nullopt unless exactly six hex digits follow the optional '#'
 */
std::optional<Rgb> parse_hex_color(const std::string& color);

/// "rgb(r,g,b)" with no spaces
std::string format_rgb(const Rgb& color);

/**
 * @brief Total light reaching a face
 *
 * Ambient lights contribute their intensity. Directional lights contribute
 * max(0, dot(normal, dir)) * intensity, where dir is the light direction
 * rotated by -camera_rotation and normalised.
 *
 * @param normal Outward camera-space unit normal
 * @param lights Scene lights, in order
 * @param camera_rotation Camera Euler angles
 * @return Intensity clamped to [0, 1]
 */
double calculate_lighting(const Vec3& normal, const std::vector<Light>& lights,
                          const Vec3& camera_rotation);

/**
 * @brief Scale a hex colour by 0.2 + 0.8 * intensity
 *
 * Channels are rounded half up. Colours that are not six-digit hex (hsl(),
 * named colours, short hex) are returned unchanged.
 */
std::string apply_lighting_to_color(const std::string& color, double intensity);

} // namespace facet
