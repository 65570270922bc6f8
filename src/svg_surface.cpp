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

#include "svg_surface.h"

#include "projector.h"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <iterator>

namespace {

// Floor grid
constexpr double GRID_SIZE = 600.0;
constexpr int GRID_DIVISIONS = 24;
constexpr int GRID_MAJOR_EVERY = 4;
constexpr double GRID_FLOOR_Y = -80.0;
constexpr double GRID_MIN_DEPTH = 50.0;
constexpr double GRID_MAJOR_OPACITY = 0.4;
constexpr double GRID_MINOR_OPACITY = 0.15;

// Palette
constexpr const char* BACKGROUND_COLOR = "#0a0a0f";
constexpr const char* PRIMARY_COLOR = "hsl(180, 100%, 50%)";
constexpr const char* NORMAL_DOT_COLOR = "hsl(120, 100%, 50%)";
constexpr const char* AXIS_X_COLOR = "hsl(0, 80%, 55%)";
constexpr const char* AXIS_Y_COLOR = "hsl(120, 70%, 50%)";

// Centre axis cross
constexpr double AXIS_HALF_LENGTH = 40.0;
constexpr double AXIS_OPACITY = 0.6;

} // anonymous namespace

namespace facet {
namespace svg {

std::optional<RenderMode> parse_render_mode(const std::string& name) {
    if (name == "solid")
        return RenderMode::SOLID;
    if (name == "wireframe")
        return RenderMode::WIREFRAME;
    if (name == "normals")
        return RenderMode::NORMALS;
    return std::nullopt;
}

const char* render_mode_name(RenderMode mode) {
    switch (mode) {
    case RenderMode::SOLID:
        return "solid";
    case RenderMode::WIREFRAME:
        return "wireframe";
    case RenderMode::NORMALS:
        return "normals";
    }
    return "unknown";
}

std::vector<GridLine> grid_floor_lines(const Camera& camera, double fov, double width,
                                       double height) {
    std::vector<GridLine> lines;
    const double step = GRID_SIZE / GRID_DIVISIONS;
    const double half = GRID_SIZE / 2.0;
    const double camera_distance = camera.position.z;

    auto add_line = [&](const Vec3& start, const Vec3& end, double opacity) {
        Vec3 a = math::rotate_euler(start, camera.rotation);
        Vec3 b = math::rotate_euler(end, camera.rotation);
        if (a.z + camera_distance <= GRID_MIN_DEPTH || b.z + camera_distance <= GRID_MIN_DEPTH) {
            return;
        }
        ScreenPoint pa = project(a, width, height, fov, camera_distance);
        ScreenPoint pb = project(b, width, height, fov, camera_distance);
        lines.push_back({pa.x, pa.y, pb.x, pb.y, opacity});
    };

    for (int i = 0; i <= GRID_DIVISIONS; i++) {
        double pos = -half + i * step;
        double opacity = (i % GRID_MAJOR_EVERY == 0) ? GRID_MAJOR_OPACITY : GRID_MINOR_OPACITY;

        add_line(Vec3(-half, GRID_FLOOR_Y, pos), Vec3(half, GRID_FLOOR_Y, pos), opacity);
        add_line(Vec3(pos, GRID_FLOOR_Y, -half), Vec3(pos, GRID_FLOOR_Y, half), opacity);
    }

    return lines;
}

std::string escape_attribute(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        switch (c) {
        case '&':
            out += "&amp;";
            break;
        case '<':
            out += "&lt;";
            break;
        case '>':
            out += "&gt;";
            break;
        case '"':
            out += "&quot;";
            break;
        case '\'':
            out += "&apos;";
            break;
        default:
            out += c;
            break;
        }
    }
    return out;
}

std::string face_path(const ProjectedFace& face) {
    if (face.projected.empty()) {
        return "";
    }

    fmt::memory_buffer out;
    fmt::format_to(std::back_inserter(out), "M {:g} {:g}", face.projected[0].x,
                   face.projected[0].y);
    for (size_t i = 1; i < face.projected.size(); i++) {
        fmt::format_to(std::back_inserter(out), " L {:g} {:g}", face.projected[i].x,
                       face.projected[i].y);
    }
    fmt::format_to(std::back_inserter(out), " Z");
    return fmt::to_string(out);
}

std::string render_svg(const std::vector<ProjectedFace>& faces, double width, double height,
                       RenderMode mode, const std::vector<GridLine>& grid, bool draw_axis) {
    fmt::memory_buffer out;
    auto it = std::back_inserter(out);

    fmt::format_to(it,
                   "<svg xmlns=\"http://www.w3.org/2000/svg\" width=\"{:g}\" height=\"{:g}\" "
                   "viewBox=\"0 0 {:g} {:g}\">\n",
                   width, height, width, height);
    fmt::format_to(it, "  <defs>\n"
                       "    <linearGradient id=\"selectionGradient\" x1=\"0%\" y1=\"0%\" "
                       "x2=\"100%\" y2=\"100%\">\n"
                       "      <stop offset=\"0%\" stop-color=\"hsl(217, 91%, 60%)\"/>\n"
                       "      <stop offset=\"50%\" stop-color=\"hsl(280, 100%, 60%)\"/>\n"
                       "      <stop offset=\"100%\" stop-color=\"hsl(330, 81%, 60%)\"/>\n"
                       "    </linearGradient>\n"
                       "  </defs>\n");
    fmt::format_to(it, "  <rect width=\"100%\" height=\"100%\" fill=\"{}\"/>\n",
                   BACKGROUND_COLOR);

    if (!grid.empty()) {
        fmt::format_to(it, "  <g class=\"grid-floor\">\n");
        for (const auto& line : grid) {
            fmt::format_to(it,
                           "    <line x1=\"{:g}\" y1=\"{:g}\" x2=\"{:g}\" y2=\"{:g}\" "
                           "stroke=\"{}\" stroke-width=\"1\" opacity=\"{:g}\"/>\n",
                           line.x1, line.y1, line.x2, line.y2, PRIMARY_COLOR, line.opacity);
        }
        fmt::format_to(it, "  </g>\n");
    }

    for (const auto& face : faces) {
        std::string path = face_path(face);
        if (path.empty()) {
            continue;
        }

        fmt::format_to(it, "  <g data-object=\"{}\">\n", escape_attribute(face.object_id));
        switch (mode) {
        case RenderMode::SOLID:
            fmt::format_to(it,
                           "    <path d=\"{}\" fill=\"{}\" stroke=\"rgba(0,0,0,0.1)\" "
                           "stroke-width=\"0.5\"/>\n",
                           path, escape_attribute(face.color));
            break;
        case RenderMode::WIREFRAME:
            fmt::format_to(it,
                           "    <path d=\"{}\" fill=\"none\" stroke=\"{}\" "
                           "stroke-width=\"1\" opacity=\"0.8\"/>\n",
                           path, PRIMARY_COLOR);
            break;
        case RenderMode::NORMALS: {
            double cx = 0.0;
            double cy = 0.0;
            for (const auto& p : face.projected) {
                cx += p.x;
                cy += p.y;
            }
            cx /= static_cast<double>(face.projected.size());
            cy /= static_cast<double>(face.projected.size());
            fmt::format_to(it,
                           "    <path d=\"{}\" fill=\"rgba(0, 255, 255, 0.1)\" stroke=\"{}\" "
                           "stroke-width=\"0.5\" opacity=\"0.6\"/>\n",
                           path, PRIMARY_COLOR);
            fmt::format_to(it, "    <circle cx=\"{:g}\" cy=\"{:g}\" r=\"2\" fill=\"{}\"/>\n",
                           cx, cy, NORMAL_DOT_COLOR);
            break;
        }
        }

        if (face.is_selected) {
            fmt::format_to(it,
                           "    <path class=\"selection\" d=\"{}\" fill=\"none\" "
                           "stroke=\"url(#selectionGradient)\" stroke-width=\"3\" "
                           "opacity=\"0.8\"/>\n",
                           path);
        }
        fmt::format_to(it, "  </g>\n");
    }

    if (draw_axis) {
        const double cx = width / 2.0;
        const double cy = height / 2.0;
        fmt::format_to(it, "  <g class=\"axis\" opacity=\"{:g}\">\n", AXIS_OPACITY);
        fmt::format_to(it,
                       "    <line x1=\"{:g}\" y1=\"{:g}\" x2=\"{:g}\" y2=\"{:g}\" stroke=\"{}\" "
                       "stroke-width=\"2\"/>\n",
                       cx - AXIS_HALF_LENGTH, cy, cx + AXIS_HALF_LENGTH, cy, AXIS_X_COLOR);
        fmt::format_to(it,
                       "    <line x1=\"{:g}\" y1=\"{:g}\" x2=\"{:g}\" y2=\"{:g}\" stroke=\"{}\" "
                       "stroke-width=\"2\"/>\n",
                       cx, cy - AXIS_HALF_LENGTH, cx, cy + AXIS_HALF_LENGTH, AXIS_Y_COLOR);
        fmt::format_to(it, "  </g>\n");
    }

    fmt::format_to(it, "</svg>\n");

    spdlog::trace("[SVG Surface] {} faces, {} grid lines, mode={}", faces.size(), grid.size(),
                  render_mode_name(mode));
    return fmt::to_string(out);
}

bool point_in_polygon(const std::vector<ScreenPoint>& polygon, double x, double y) {
    bool inside = false;
    const size_t n = polygon.size();
    for (size_t i = 0, j = n - 1; i < n; j = i++) {
        const ScreenPoint& a = polygon[i];
        const ScreenPoint& b = polygon[j];
        if ((a.y > y) != (b.y > y) && x < (b.x - a.x) * (y - a.y) / (b.y - a.y) + a.x) {
            inside = !inside;
        }
    }
    return inside;
}

std::optional<std::string> pick_object(const std::vector<ProjectedFace>& faces, double x,
                                       double y) {
    for (auto it = faces.rbegin(); it != faces.rend(); ++it) {
        if (point_in_polygon(it->projected, x, y)) {
            return it->object_id;
        }
    }
    return std::nullopt;
}

} // namespace svg
} // namespace facet
