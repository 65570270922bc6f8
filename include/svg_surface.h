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

#include <optional>
#include <string>
#include <vector>

/**
 * @file svg_surface.h
 * @brief SVG drawing surface for rendered faces
 *
 * Paints ProjectedFace lists in array order (painter's algorithm) and maps
 * screen points back to object ids. Coordinates are emitted as given; the
 * surface never re-sorts or clips.
 */

namespace facet {
namespace svg {

enum class RenderMode {
    SOLID,     ///< Lit face colour with a faint outline
    WIREFRAME, ///< Outline only
    NORMALS    ///< Translucent fill plus a dot at each face centre
};

std::optional<RenderMode> parse_render_mode(const std::string& name);
const char* render_mode_name(RenderMode mode);

/**
 * @brief Screen-space line of the floor grid
 */
struct GridLine {
    double x1;
    double y1;
    double x2;
    double y2;
    double opacity; ///< Major lines (every 4th) are brighter
};

/**
 * @brief Floor grid lines in screen space
 *
 * A 600 x 600 grid with 24 divisions on the plane y = -80, rotated by the
 * camera angles and projected. Lines with an endpoint closer than 50 units to
 * the camera plane are dropped.
 */
std::vector<GridLine> grid_floor_lines(const Camera& camera, double fov, double width,
                                       double height);

/// "M x y L x y ... Z", or an empty string for a face without points
std::string face_path(const ProjectedFace& face);

/**
 * @brief Render a complete SVG document
 *
 * @param faces Faces in paint order
 * @param width Viewport width (pixels)
 * @param height Viewport height (pixels)
 * @param mode Face style
 * @param grid Optional floor grid drawn beneath the faces
 * @param draw_axis Draw the centre axis cross above the faces
 * @return SVG document text
 */
std::string render_svg(const std::vector<ProjectedFace>& faces, double width, double height,
                       RenderMode mode = RenderMode::SOLID,
                       const std::vector<GridLine>& grid = {}, bool draw_axis = false);

/// Escape &, <, >, " and ' for use inside a double-quoted XML attribute
std::string escape_attribute(const std::string& value);

/// Even-odd point-in-polygon test on screen coordinates
bool point_in_polygon(const std::vector<ScreenPoint>& polygon, double x, double y);

/**
 * @brief Hit test a screen point
 * @return Object id of the topmost face (last in paint order) containing the
 *         point, or std::nullopt for the background
 */
std::optional<std::string> pick_object(const std::vector<ProjectedFace>& faces, double x,
                                       double y);

} // namespace svg
} // namespace facet
