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

#include <cmath>
#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace facet {

// ============================================================================
// Editor gesture constants
// ============================================================================

constexpr double MOVE_SENSITIVITY = 0.5;     ///< World units per pixel
constexpr double ROTATE_SENSITIVITY = 0.01;  ///< Radians per pixel
constexpr double SCALE_SENSITIVITY = 0.005;  ///< Scale factor change per pixel
constexpr double ORBIT_SENSITIVITY = 0.005;  ///< Camera radians per pixel
constexpr double PAN_SENSITIVITY = 0.5;      ///< Camera units per pixel
constexpr double ZOOM_SENSITIVITY = 0.5;     ///< Camera units per wheel unit
constexpr double CAMERA_PITCH_LIMIT = M_PI / 2.0 - 0.1;
constexpr double MIN_CAMERA_DISTANCE = 100.0;
constexpr double MAX_CAMERA_DISTANCE = 2000.0;

enum class ToolType { SELECT, MOVE, ROTATE, SCALE };

/// Parse "select" / "move" / "rotate" / "scale"
std::optional<ToolType> parse_tool_type(const std::string& name);

/**
 * @brief Incremental transform from an editor tool
 *
 * Position and rotation are added to the object's values, scale is multiplied
 * componentwise. Absent members leave the corresponding property alone.
 */
struct TransformDelta {
    std::optional<Vec3> position;
    std::optional<Vec3> rotation;
    std::optional<Vec3> scale;
};

/**
 * @brief Partial update of a scene object (unset members are left unchanged)
 */
struct ObjectUpdate {
    std::optional<std::string> name;
    std::optional<PrimitiveKind> kind;
    std::optional<Vec3> position;
    std::optional<Vec3> rotation;
    std::optional<Vec3> scale;
    std::optional<Material> material;
    std::optional<bool> visible;
    std::optional<bool> locked;
};

/**
 * @brief Convert a pointer drag into a tool transform
 *
 * - MOVE: position (dx, -dy, 0) * 0.5, axis-constrained, then grid-snapped
 *   when grid_size > 0
 * - ROTATE: rotation (dy, dx, 0) * 0.01, axis-constrained
 * - SCALE: uniform scale 1 + 0.005 * dy
 * - SELECT: empty delta
 */
TransformDelta tool_delta(ToolType tool, double dx, double dy,
                          math::AxisConstraint axis = math::AxisConstraint::NONE,
                          double grid_size = 0.0);

/// Camera rotation change for an orbit drag: (dy, dx, 0) * 0.005
Vec3 orbit_delta(double dx, double dy);

/// Camera position change for a pan drag: (-dx, dy, 0) * 0.5
Vec3 pan_delta(double dx, double dy);

/// Camera distance change for a wheel event
double zoom_delta(double wheel_delta_y);

/// Default camera: position (0, 0, 500), rotation (0.4, -0.5, 0), fov 800
Camera default_camera();

/// Default camera with its distance and fov taken from the engine config
Camera default_camera(const EngineConfig& config);

/// The editor's five default materials: cyan, magenta, yellow, orange, green
std::vector<Material> default_materials();

/**
 * @brief Light rig for a lighting mode
 *
 * Day: white ambient 0.6 plus warm directional 1.0 along (1, 1, 0.5).
 * Night: blue ambient 0.3 plus blue directional 0.5 along (-1, 1, 1).
 */
std::vector<Light> lights_for_mode(LightingMode mode);

const char* lighting_mode_name(LightingMode mode);
std::optional<LightingMode> parse_lighting_mode(const std::string& name);

/// Cube, sphere and torus with night lighting and the default camera
Scene create_initial_scene();

/**
 * @brief Editor scene state
 *
 * Owns one Scene and applies the editor's mutations to it. Mutations that
 * name an unknown object id (or a locked object, for tool transforms) are
 * logged and return false without touching the scene.
 *
 * Object placement for add_object() draws from an internal std::mt19937
 * seeded at construction, so a given seed always yields the same scene.
 *
 * Thread safety: none. Callers own synchronization.
 */
class SceneStore {
  public:
    explicit SceneStore(uint32_t seed = std::mt19937::default_seed);
    SceneStore(Scene scene, uint32_t seed);

    const Scene& scene() const {
        return scene_;
    }

    /// Replace the whole scene (e.g. after loading a file)
    void set_scene(Scene scene);

    const SceneObject* find_object(const std::string& id) const;
    const SceneObject* selected_object() const;

    // =========================================================================
    // OBJECTS
    // =========================================================================

    /**
     * @brief Select an object, or clear the selection with std::nullopt
     * @return false if the id does not exist
     */
    bool select_object(const std::optional<std::string>& id);

    /**
     * @brief Append a new object of the given kind and select it
     *
     * Position is random within (+-50, +-50, +-25), the material is a random
     * default material, and the name is "<Kind> N" with N = object count.
     *
     * @return Id of the new object
     */
    std::string add_object(PrimitiveKind kind);

    bool update_object(const std::string& id, const ObjectUpdate& update);

    /**
     * @brief Apply a tool delta to an object
     * @return false if the object is unknown or locked
     */
    bool apply_transform(const std::string& id, const TransformDelta& delta);

    /// Remove an object; clears the selection if it pointed at it
    bool delete_object(const std::string& id);

    // =========================================================================
    // CAMERA
    // =========================================================================

    /// Set the camera rotation; pitch (x) is clamped to +-(pi/2 - 0.1)
    void rotate_camera(const Vec3& rotation);

    /// Add an orbit drag to the current camera rotation
    void orbit_camera(double dx, double dy);

    void pan_camera(const Vec3& offset);

    /// Adjust the camera distance, clamped to [100, 2000]
    void zoom_camera(double delta);

    void reset_camera();

    // =========================================================================
    // VIEW STATE
    // =========================================================================

    void move_cursor_3d(const Vec3& position);
    void toggle_grid();
    void toggle_axis();

    /// Switch mode and replace the scene lights with that mode's rig
    void set_lighting_mode(LightingMode mode);

  private:
    SceneObject* find_mutable(const std::string& id);
    std::string next_object_id(PrimitiveKind kind);

    Scene scene_;
    std::mt19937 rng_;
    unsigned int id_counter_ = 1;
};

} // namespace facet
