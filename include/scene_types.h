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

#ifndef FACET_SCENE_TYPES_H
#define FACET_SCENE_TYPES_H

#include "vector_math.h"

#include <optional>
#include <string>
#include <vector>

/**
 * @file scene_types.h
 * @brief Scene snapshot, engine configuration and render output types
 *
 * Ownership model:
 * - Scene, SceneObject, Camera, Light and EngineConfig are read-only snapshots
 *   for the duration of a render call. The renderer never mutates them.
 * - Face lists are regenerated on every call (no mesh cache).
 * - ProjectedFace values are created fresh per call and handed to the drawing
 *   surface, which paints them in array order.
 */

namespace facet {

/**
 * @brief Parametric solid kinds
 *
 * The last three are "volumetric" kinds whose geometry depends on time.
 */
enum class PrimitiveKind { BOX, SPHERE, CYLINDER, TORUS, CONE, PYRAMID, METABALLS, FLUID_BLOB, CLOUD_VOLUME };

/**
 * @brief Scene-file name of a primitive kind ("box", "fluidBlob", ...)
 */
const char* primitive_kind_name(PrimitiveKind kind);

/**
 * @brief Parse a scene-file primitive name
 * @return Kind, or std::nullopt for unrecognized names
 */
std::optional<PrimitiveKind> parse_primitive_kind(const std::string& name);

/// True for kinds whose mesh is a function of the animation time
bool is_time_dependent(PrimitiveKind kind);

/**
 * @brief Planar polygon in object-local space
 *
 * The vertex loop is planar with 3 or 4 vertices. (v1 - v0) x (v2 - v0) is the
 * raw normal. `anchor` is a point inside the solid that the face's outward side
 * points away from: the object origin for convex kinds, the tube core for the
 * torus, the puff centre for volumetric clusters.
 */
struct Face {
    std::vector<Vec3> vertices;
    std::string color; ///< Base colour, "#rrggbb" or "hsl(h, s%, l%)"
    Vec3 anchor{0.0, 0.0, 0.0};
};

struct Material {
    std::string id;
    std::string color = "#00ffff"; ///< The only field the render pipeline reads
    double ambient = 0.2;
    double diffuse = 0.8;
    double specular = 0.5;
    double shininess = 32.0;
};

struct SceneObject {
    std::string id;
    std::string name;
    PrimitiveKind kind = PrimitiveKind::BOX;
    Vec3 position{0.0, 0.0, 0.0};
    Vec3 rotation{0.0, 0.0, 0.0}; ///< Euler angles in radians (X, Y, Z order)
    Vec3 scale{1.0, 1.0, 1.0};
    Material material;
    bool visible = true;
    bool locked = false; ///< Editor-only; ignored by the renderer
};

/**
 * @brief Viewer camera
 *
 * position.x/y are the pan offset, position.z is the camera distance (dolly).
 * The camera sits at z = -position.z looking down +Z.
 */
struct Camera {
    Vec3 position{0.0, 0.0, 500.0};
    Vec3 rotation{0.0, 0.0, 0.0};
    double fov = 800.0;
    double near_plane = 1.0;    ///< Advisory only
    double far_plane = 2000.0; ///< Advisory only
};

enum class LightKind { AMBIENT, DIRECTIONAL };

struct Light {
    LightKind kind = LightKind::AMBIENT;
    std::string color = "#ffffff";
    double intensity = 1.0;
    Vec3 direction{0.0, 0.0, 1.0}; ///< World space, directional lights only
};

enum class LightingMode { DAY, NIGHT };

struct Scene {
    std::vector<SceneObject> objects;
    std::vector<Light> lights;
    Camera camera;
    Vec3 cursor_3d{0.0, 0.0, 0.0};
    std::optional<std::string> selected_object_id;
    bool grid_visible = true;  ///< Ignored by the renderer
    bool axis_visible = true;  ///< Ignored by the renderer
    LightingMode lighting_mode = LightingMode::NIGHT;
};

/**
 * @brief Engine-wide render parameters
 *
 * ambient/directional intensity and light_direction describe the default light
 * rig used when a scene carries no lights of its own.
 */
struct EngineConfig {
    double fov = 800.0;
    double camera_distance = 500.0;
    double ambient_intensity = 0.3;
    double directional_intensity = 0.8;
    Vec3 light_direction = math::normalize(Vec3(1.0, 1.0, 0.5));
    double primitive_size = 50.0;
    double visibility_epsilon = 0.15;
};

/**
 * @brief One polygon ready for the drawing surface
 */
struct ProjectedFace {
    std::vector<Vec3> vertices;         ///< Camera-space vertices
    std::vector<ScreenPoint> projected; ///< Screen-space polygon (same order)
    std::string color;                  ///< CSS colour after lighting
    double depth = 0.0;                 ///< Camera-space centroid Z (larger = farther)
    double light_intensity = 0.0;       ///< In [0, 1]
    Vec3 normal{0.0, 0.0, 1.0};         ///< Outward camera-space normal
    std::string object_id;
    bool is_selected = false;
};

} // namespace facet

#endif // FACET_SCENE_TYPES_H
