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

#include "mesh_generator.h"

#include "volumetric_generator.h"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>

namespace {

constexpr double TWO_PI = 2.0 * M_PI;

// Flat base colours (overridden by the material colour at render time)
constexpr const char* BOX_FRONT_COLOR = "#00ffff";
constexpr const char* BOX_BACK_COLOR = "#00cccc";
constexpr const char* BOX_TOP_COLOR = "#00eeee";
constexpr const char* BOX_BOTTOM_COLOR = "#00aaaa";
constexpr const char* BOX_RIGHT_COLOR = "#00dddd";
constexpr const char* BOX_LEFT_COLOR = "#00bbbb";
constexpr const char* CYLINDER_TOP_COLOR = "#00ffee";
constexpr const char* CYLINDER_BOTTOM_COLOR = "#00ccbb";
constexpr const char* CONE_BASE_COLOR = "#00bbaa";

// Sphere gradient: cyan range across longitude, brighter toward the south pole
constexpr facet::mesh::HslRamp SPHERE_RAMP = {160.0, 60.0, 100.0, 40.0, 20.0};

int sanitize_segments(int segments) {
    if (segments < facet::mesh::MIN_SEGMENTS) {
        spdlog::warn("[Mesh Generator] Segment count {} too low, using {}", segments,
                     facet::mesh::MIN_SEGMENTS);
        return facet::mesh::MIN_SEGMENTS;
    }
    return segments;
}

} // anonymous namespace

namespace facet {

// ============================================================================
// Primitive kind names
// ============================================================================

const char* primitive_kind_name(PrimitiveKind kind) {
    switch (kind) {
    case PrimitiveKind::BOX:
        return "box";
    case PrimitiveKind::SPHERE:
        return "sphere";
    case PrimitiveKind::CYLINDER:
        return "cylinder";
    case PrimitiveKind::TORUS:
        return "torus";
    case PrimitiveKind::CONE:
        return "cone";
    case PrimitiveKind::PYRAMID:
        return "pyramid";
    case PrimitiveKind::METABALLS:
        return "metaballs";
    case PrimitiveKind::FLUID_BLOB:
        return "fluidBlob";
    case PrimitiveKind::CLOUD_VOLUME:
        return "cloudVolume";
    }
    return "box";
}

std::optional<PrimitiveKind> parse_primitive_kind(const std::string& name) {
    static const PrimitiveKind ALL_KINDS[] = {
        PrimitiveKind::BOX,       PrimitiveKind::SPHERE,     PrimitiveKind::CYLINDER,
        PrimitiveKind::TORUS,     PrimitiveKind::CONE,       PrimitiveKind::PYRAMID,
        PrimitiveKind::METABALLS, PrimitiveKind::FLUID_BLOB, PrimitiveKind::CLOUD_VOLUME};

    for (PrimitiveKind kind : ALL_KINDS) {
        if (name == primitive_kind_name(kind)) {
            return kind;
        }
    }
    return std::nullopt;
}

bool is_time_dependent(PrimitiveKind kind) {
    return kind == PrimitiveKind::METABALLS || kind == PrimitiveKind::FLUID_BLOB ||
           kind == PrimitiveKind::CLOUD_VOLUME;
}

namespace mesh {

std::string hsl_color(double hue, double saturation, double lightness) {
    return fmt::format("hsl({:g}, {:g}%, {:g}%)", hue, saturation, lightness);
}

// ============================================================================
// Box
// ============================================================================

std::vector<Face> generate_box(double size) {
    const double s = size / 2.0;

    /**
     * Corner layout:
     *
     *        7 ──────── 6          y
     *       /│         /│          │
     *      3 ──────── 2 │          └── x
     *      │ 4 ───────│ 5         /
     *      │/         │/         z
     *      0 ──────── 1
     *
     * 0-3 sit on z = -s, 4-7 on z = +s. Each loop below is counter-clockwise
     * seen from outside, so the raw normal points out of the cube.
     */
    const Vec3 v[8] = {
        Vec3(-s, -s, -s), Vec3(s, -s, -s), Vec3(s, s, -s), Vec3(-s, s, -s),
        Vec3(-s, -s, s),  Vec3(s, -s, s),  Vec3(s, s, s),  Vec3(-s, s, s),
    };

    std::vector<Face> faces;
    faces.reserve(6);
    faces.push_back({{v[4], v[5], v[6], v[7]}, BOX_FRONT_COLOR});
    faces.push_back({{v[1], v[0], v[3], v[2]}, BOX_BACK_COLOR});
    faces.push_back({{v[7], v[6], v[2], v[3]}, BOX_TOP_COLOR});
    faces.push_back({{v[0], v[1], v[5], v[4]}, BOX_BOTTOM_COLOR});
    faces.push_back({{v[5], v[1], v[2], v[6]}, BOX_RIGHT_COLOR});
    faces.push_back({{v[0], v[4], v[7], v[3]}, BOX_LEFT_COLOR});
    return faces;
}

// ============================================================================
// Sphere / ellipsoid
// ============================================================================

std::vector<Face> generate_ellipsoid(const Vec3& center, const Vec3& radii, int segments,
                                     const HslRamp& ramp) {
    segments = sanitize_segments(segments);

    auto vertex_at = [&](double theta, double phi) {
        return Vec3(center.x + radii.x * std::sin(theta) * std::cos(phi),
                    center.y + radii.y * std::cos(theta),
                    center.z + radii.z * std::sin(theta) * std::sin(phi));
    };

    std::vector<Face> faces;
    faces.reserve(static_cast<size_t>(segments) * segments);

    for (int lat = 0; lat < segments; lat++) {
        double theta1 = (static_cast<double>(lat) / segments) * M_PI;
        double theta2 = (static_cast<double>(lat + 1) / segments) * M_PI;

        for (int lon = 0; lon < segments; lon++) {
            double phi1 = (static_cast<double>(lon) / segments) * TWO_PI;
            double phi2 = (static_cast<double>(lon + 1) / segments) * TWO_PI;

            Vec3 v1 = vertex_at(theta1, phi1);
            Vec3 v2 = vertex_at(theta1, phi2);
            Vec3 v3 = vertex_at(theta2, phi2);
            Vec3 v4 = vertex_at(theta2, phi1);

            double hue = ramp.hue_base + (static_cast<double>(lon) / segments) * ramp.hue_span;
            double lightness =
                ramp.lightness_base + (static_cast<double>(lat) / segments) * ramp.lightness_span;

            Face face;
            face.color = hsl_color(hue, ramp.saturation, lightness);
            face.anchor = center;

            // Pole bands collapse one edge to a point: emit triangles there
            if (lat == 0) {
                face.vertices = {v1, v3, v4};
            } else if (lat == segments - 1) {
                face.vertices = {v1, v2, v3};
            } else {
                face.vertices = {v1, v2, v3, v4};
            }
            faces.push_back(std::move(face));
        }
    }

    return faces;
}

std::vector<Face> generate_sphere(double radius, int segments) {
    return generate_ellipsoid(Vec3(0.0, 0.0, 0.0), Vec3(radius, radius, radius), segments,
                              SPHERE_RAMP);
}

// ============================================================================
// Cylinder
// ============================================================================

std::vector<Face> generate_cylinder(double radius, double height, int segments) {
    segments = sanitize_segments(segments);
    const double h = height / 2.0;

    const Vec3 top_center(0.0, h, 0.0);
    const Vec3 bottom_center(0.0, -h, 0.0);

    std::vector<Face> faces;
    faces.reserve(static_cast<size_t>(segments) * 3);

    for (int i = 0; i < segments; i++) {
        double angle1 = (static_cast<double>(i) / segments) * TWO_PI;
        double angle2 = (static_cast<double>(i + 1) / segments) * TWO_PI;

        double x1 = radius * std::cos(angle1);
        double z1 = radius * std::sin(angle1);
        double x2 = radius * std::cos(angle2);
        double z2 = radius * std::sin(angle2);

        // Side
        faces.push_back({{Vec3(x1, h, z1), Vec3(x2, h, z2), Vec3(x2, -h, z2), Vec3(x1, -h, z1)},
                         hsl_color(170.0 + (static_cast<double>(i) / segments) * 30.0, 100.0,
                                   50.0)});

        // Caps share the centre vertex (triangle fan)
        faces.push_back({{top_center, Vec3(x2, h, z2), Vec3(x1, h, z1)}, CYLINDER_TOP_COLOR});
        faces.push_back(
            {{bottom_center, Vec3(x1, -h, z1), Vec3(x2, -h, z2)}, CYLINDER_BOTTOM_COLOR});
    }

    return faces;
}

// ============================================================================
// Torus
// ============================================================================

std::vector<Face> generate_torus(double major_radius, double minor_radius, int segments) {
    segments = sanitize_segments(segments);

    auto vertex_at = [&](double theta, double phi) {
        double ring = major_radius + minor_radius * std::cos(phi);
        return Vec3(ring * std::cos(theta), minor_radius * std::sin(phi), ring * std::sin(theta));
    };

    std::vector<Face> faces;
    faces.reserve(static_cast<size_t>(segments) * segments);

    for (int i = 0; i < segments; i++) {
        double theta1 = (static_cast<double>(i) / segments) * TWO_PI;
        double theta2 = (static_cast<double>(i + 1) / segments) * TWO_PI;
        double theta_mid = (theta1 + theta2) / 2.0;

        // The torus is not convex: orient each face against the tube core
        Vec3 core(major_radius * std::cos(theta_mid), 0.0, major_radius * std::sin(theta_mid));

        for (int j = 0; j < segments; j++) {
            double phi1 = (static_cast<double>(j) / segments) * TWO_PI;
            double phi2 = (static_cast<double>(j + 1) / segments) * TWO_PI;

            Face face;
            // Reversed loop: (theta1,phi2) -> (theta2,phi2) -> (theta2,phi1) -> (theta1,phi1)
            face.vertices = {vertex_at(theta1, phi2), vertex_at(theta2, phi2),
                             vertex_at(theta2, phi1), vertex_at(theta1, phi1)};
            face.color = hsl_color((static_cast<double>(i) / segments) * 40.0 + 180.0, 100.0,
                                   45.0 + (static_cast<double>(j) / segments) * 15.0);
            face.anchor = core;
            faces.push_back(std::move(face));
        }
    }

    return faces;
}

// ============================================================================
// Cone
// ============================================================================

std::vector<Face> generate_cone(double radius, double height, int segments) {
    segments = sanitize_segments(segments);
    const double h = height / 2.0;

    const Vec3 apex(0.0, h, 0.0);
    const Vec3 base_center(0.0, -h, 0.0);

    std::vector<Face> faces;
    faces.reserve(static_cast<size_t>(segments) * 2);

    for (int i = 0; i < segments; i++) {
        double angle1 = (static_cast<double>(i) / segments) * TWO_PI;
        double angle2 = (static_cast<double>(i + 1) / segments) * TWO_PI;

        Vec3 p1(radius * std::cos(angle1), -h, radius * std::sin(angle1));
        Vec3 p2(radius * std::cos(angle2), -h, radius * std::sin(angle2));

        faces.push_back(
            {{apex, p2, p1}, hsl_color(175.0 + (static_cast<double>(i) / segments) * 25.0, 100.0,
                                       50.0)});
        faces.push_back({{base_center, p1, p2}, CONE_BASE_COLOR});
    }

    return faces;
}

// ============================================================================
// Pyramid
// ============================================================================

std::vector<Face> generate_pyramid(double size, double height) {
    const double s = size / 2.0;
    const double h = height / 2.0;

    const Vec3 apex(0.0, h, 0.0);
    const Vec3 base[4] = {Vec3(-s, -h, -s), Vec3(s, -h, -s), Vec3(s, -h, s), Vec3(-s, -h, s)};

    // Side loops run apex -> right-hand corner -> left-hand corner seen from outside
    return {
        {{apex, base[3], base[2]}, "#00ffdd"},           // Front (+Z)
        {{apex, base[2], base[1]}, "#00eedd"},           // Right (+X)
        {{apex, base[1], base[0]}, "#00ddcc"},           // Back (-Z)
        {{apex, base[0], base[3]}, "#00ccbb"},           // Left (-X)
        {{base[0], base[1], base[2], base[3]}, "#00aabb"}, // Base (-Y)
    };
}

// ============================================================================
// Dispatch
// ============================================================================

std::vector<Face> generate_primitive_faces(PrimitiveKind kind, double size, double time) {
    switch (kind) {
    case PrimitiveKind::BOX:
        return generate_box(size);
    case PrimitiveKind::SPHERE:
        return generate_sphere(size);
    case PrimitiveKind::CYLINDER:
        return generate_cylinder(size * 0.6, size * 1.6);
    case PrimitiveKind::TORUS:
        return generate_torus(size * 0.8, size * 0.3);
    case PrimitiveKind::CONE:
        return generate_cone(size * 0.8, size * 1.6);
    case PrimitiveKind::PYRAMID:
        return generate_pyramid(size, size * 1.4);
    case PrimitiveKind::METABALLS:
        return generate_metaballs(size, time);
    case PrimitiveKind::FLUID_BLOB:
        return generate_fluid_blob(size, time);
    case PrimitiveKind::CLOUD_VOLUME:
        return generate_cloud_volume(size, time);
    }

    spdlog::warn("[Mesh Generator] Unknown primitive kind {}, using box",
                 static_cast<int>(kind));
    return generate_box(size);
}

} // namespace mesh
} // namespace facet
