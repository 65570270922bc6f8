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

#include "scene_store.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <utility>

namespace {

// Random placement extents for new objects
constexpr double SPAWN_RANGE_X = 100.0;
constexpr double SPAWN_RANGE_Y = 100.0;
constexpr double SPAWN_RANGE_Z = 50.0;

facet::Material make_material(const char* id, const char* color) {
    facet::Material material;
    material.id = id;
    material.color = color;
    material.ambient = 0.2;
    material.diffuse = 0.8;
    material.specular = 0.5;
    material.shininess = 32.0;
    return material;
}

facet::Light make_light(facet::LightKind kind, const char* color, double intensity,
                        const facet::Vec3& direction) {
    facet::Light light;
    light.kind = kind;
    light.color = color;
    light.intensity = intensity;
    light.direction = direction;
    return light;
}

facet::SceneObject make_object(const char* id, const char* name, facet::PrimitiveKind kind,
                               const facet::Vec3& position, const facet::Vec3& rotation,
                               const facet::Vec3& scale, const facet::Material& material) {
    facet::SceneObject object;
    object.id = id;
    object.name = name;
    object.kind = kind;
    object.position = position;
    object.rotation = rotation;
    object.scale = scale;
    object.material = material;
    return object;
}

} // anonymous namespace

namespace facet {

// ============================================================================
// Gestures
// ============================================================================

std::optional<ToolType> parse_tool_type(const std::string& name) {
    if (name == "select")
        return ToolType::SELECT;
    if (name == "move")
        return ToolType::MOVE;
    if (name == "rotate")
        return ToolType::ROTATE;
    if (name == "scale")
        return ToolType::SCALE;
    return std::nullopt;
}

TransformDelta tool_delta(ToolType tool, double dx, double dy, math::AxisConstraint axis,
                          double grid_size) {
    TransformDelta delta;

    switch (tool) {
    case ToolType::MOVE: {
        Vec3 offset(dx * MOVE_SENSITIVITY, -dy * MOVE_SENSITIVITY, 0.0);
        offset = math::constrain_to_axis(offset, axis);
        if (grid_size > 0.0) {
            offset = math::snap_to_grid(offset, grid_size);
        }
        delta.position = offset;
        break;
    }
    case ToolType::ROTATE:
        delta.rotation = math::constrain_to_axis(
            Vec3(dy * ROTATE_SENSITIVITY, dx * ROTATE_SENSITIVITY, 0.0), axis);
        break;
    case ToolType::SCALE: {
        double factor = 1.0 + dy * SCALE_SENSITIVITY;
        delta.scale = Vec3(factor, factor, factor);
        break;
    }
    case ToolType::SELECT:
        break;
    }

    return delta;
}

Vec3 orbit_delta(double dx, double dy) {
    return Vec3(dy * ORBIT_SENSITIVITY, dx * ORBIT_SENSITIVITY, 0.0);
}

Vec3 pan_delta(double dx, double dy) {
    return Vec3(-dx * PAN_SENSITIVITY, dy * PAN_SENSITIVITY, 0.0);
}

double zoom_delta(double wheel_delta_y) {
    return wheel_delta_y * ZOOM_SENSITIVITY;
}

// ============================================================================
// Defaults
// ============================================================================

Camera default_camera() {
    Camera camera;
    camera.position = Vec3(0.0, 0.0, 500.0);
    camera.rotation = Vec3(0.4, -0.5, 0.0);
    camera.fov = 800.0;
    camera.near_plane = 1.0;
    camera.far_plane = 2000.0;
    return camera;
}

Camera default_camera(const EngineConfig& config) {
    Camera camera = default_camera();
    camera.position.z = config.camera_distance;
    camera.fov = config.fov;
    return camera;
}

std::vector<Material> default_materials() {
    return {make_material("cyan", "#00ffff"), make_material("magenta", "#ff00ff"),
            make_material("yellow", "#ffff00"), make_material("orange", "#ff8800"),
            make_material("green", "#00ff88")};
}

std::vector<Light> lights_for_mode(LightingMode mode) {
    if (mode == LightingMode::DAY) {
        return {make_light(LightKind::AMBIENT, "#ffffff", 0.6, Vec3(0.0, 0.0, 1.0)),
                make_light(LightKind::DIRECTIONAL, "#ffffee", 1.0, Vec3(1.0, 1.0, 0.5))};
    }
    return {make_light(LightKind::AMBIENT, "#8888ff", 0.3, Vec3(0.0, 0.0, 1.0)),
            make_light(LightKind::DIRECTIONAL, "#aaaaff", 0.5, Vec3(-1.0, 1.0, 1.0))};
}

const char* lighting_mode_name(LightingMode mode) {
    return mode == LightingMode::DAY ? "day" : "night";
}

std::optional<LightingMode> parse_lighting_mode(const std::string& name) {
    if (name == "day")
        return LightingMode::DAY;
    if (name == "night")
        return LightingMode::NIGHT;
    return std::nullopt;
}

Scene create_initial_scene() {
    const std::vector<Material> materials = default_materials();

    Scene scene;
    scene.objects = {
        make_object("box-1", "Cube 1", PrimitiveKind::BOX, Vec3(-80.0, 30.0, 0.0),
                    Vec3(0.3, 0.3, 0.0), Vec3(1.0, 1.0, 1.0), materials[0]),
        make_object("sphere-1", "Sphere 1", PrimitiveKind::SPHERE, Vec3(80.0, -20.0, 20.0),
                    Vec3(0.0, 0.0, 0.0), Vec3(0.9, 0.9, 0.9), materials[1]),
        make_object("torus-1", "Torus 1", PrimitiveKind::TORUS, Vec3(0.0, -60.0, -30.0),
                    Vec3(0.5, 0.2, 0.0), Vec3(1.0, 1.0, 1.0), materials[2]),
    };
    scene.lights = lights_for_mode(LightingMode::NIGHT);
    scene.camera = default_camera();
    scene.cursor_3d = Vec3(0.0, 0.0, 0.0);
    scene.selected_object_id = std::nullopt;
    scene.grid_visible = true;
    scene.axis_visible = true;
    scene.lighting_mode = LightingMode::NIGHT;
    return scene;
}

// ============================================================================
// SceneStore
// ============================================================================

SceneStore::SceneStore(uint32_t seed) : scene_(create_initial_scene()), rng_(seed) {}

SceneStore::SceneStore(Scene scene, uint32_t seed) : scene_(std::move(scene)), rng_(seed) {}

void SceneStore::set_scene(Scene scene) {
    scene_ = std::move(scene);
    spdlog::debug("[Scene Store] Scene replaced ({} objects)", scene_.objects.size());
}

const SceneObject* SceneStore::find_object(const std::string& id) const {
    auto it = std::find_if(scene_.objects.begin(), scene_.objects.end(),
                           [&id](const SceneObject& obj) { return obj.id == id; });
    return it != scene_.objects.end() ? &*it : nullptr;
}

SceneObject* SceneStore::find_mutable(const std::string& id) {
    auto it = std::find_if(scene_.objects.begin(), scene_.objects.end(),
                           [&id](const SceneObject& obj) { return obj.id == id; });
    return it != scene_.objects.end() ? &*it : nullptr;
}

const SceneObject* SceneStore::selected_object() const {
    if (!scene_.selected_object_id) {
        return nullptr;
    }
    return find_object(*scene_.selected_object_id);
}

bool SceneStore::select_object(const std::optional<std::string>& id) {
    if (id && !find_object(*id)) {
        spdlog::warn("[Scene Store] Cannot select unknown object '{}'", *id);
        return false;
    }
    scene_.selected_object_id = id;
    spdlog::debug("[Scene Store] Selection: {}", id ? *id : std::string("(none)"));
    return true;
}

std::string SceneStore::next_object_id(PrimitiveKind kind) {
    std::string id;
    do {
        id = std::string(primitive_kind_name(kind)) + "-" + std::to_string(id_counter_++);
    } while (find_object(id));
    return id;
}

std::string SceneStore::add_object(PrimitiveKind kind) {
    const std::vector<Material> materials = default_materials();
    std::uniform_real_distribution<double> unit(0.0, 1.0);
    std::uniform_int_distribution<size_t> pick_material(0, materials.size() - 1);

    std::string display_name = primitive_kind_name(kind);
    display_name[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(display_name[0])));

    SceneObject object;
    object.id = next_object_id(kind);
    object.name = display_name + " " + std::to_string(scene_.objects.size() + 1);
    object.kind = kind;
    double x = (unit(rng_) - 0.5) * SPAWN_RANGE_X;
    double y = (unit(rng_) - 0.5) * SPAWN_RANGE_Y;
    double z = (unit(rng_) - 0.5) * SPAWN_RANGE_Z;
    object.position = Vec3(x, y, z);
    object.material = materials[pick_material(rng_)];

    spdlog::info("[Scene Store] Added {} '{}' at ({:.1f}, {:.1f}, {:.1f})", object.id,
                 object.name, x, y, z);

    scene_.objects.push_back(object);
    scene_.selected_object_id = object.id;
    return object.id;
}

bool SceneStore::update_object(const std::string& id, const ObjectUpdate& update) {
    SceneObject* object = find_mutable(id);
    if (!object) {
        spdlog::warn("[Scene Store] Cannot update unknown object '{}'", id);
        return false;
    }

    if (update.name)
        object->name = *update.name;
    if (update.kind)
        object->kind = *update.kind;
    if (update.position)
        object->position = *update.position;
    if (update.rotation)
        object->rotation = *update.rotation;
    if (update.scale)
        object->scale = *update.scale;
    if (update.material)
        object->material = *update.material;
    if (update.visible)
        object->visible = *update.visible;
    if (update.locked)
        object->locked = *update.locked;

    return true;
}

bool SceneStore::apply_transform(const std::string& id, const TransformDelta& delta) {
    SceneObject* object = find_mutable(id);
    if (!object) {
        spdlog::warn("[Scene Store] Cannot transform unknown object '{}'", id);
        return false;
    }
    if (object->locked) {
        spdlog::debug("[Scene Store] Ignoring transform of locked object '{}'", id);
        return false;
    }

    if (delta.position) {
        object->position = math::add(object->position, *delta.position);
    }
    if (delta.rotation) {
        object->rotation = math::add(object->rotation, *delta.rotation);
    }
    if (delta.scale) {
        object->scale = math::multiply_components(object->scale, *delta.scale);
    }
    return true;
}

bool SceneStore::delete_object(const std::string& id) {
    auto it = std::find_if(scene_.objects.begin(), scene_.objects.end(),
                           [&id](const SceneObject& obj) { return obj.id == id; });
    if (it == scene_.objects.end()) {
        spdlog::warn("[Scene Store] Cannot delete unknown object '{}'", id);
        return false;
    }

    scene_.objects.erase(it);
    if (scene_.selected_object_id && *scene_.selected_object_id == id) {
        scene_.selected_object_id = std::nullopt;
    }
    spdlog::info("[Scene Store] Deleted {}", id);
    return true;
}

void SceneStore::rotate_camera(const Vec3& rotation) {
    scene_.camera.rotation =
        Vec3(math::clamp(rotation.x, -CAMERA_PITCH_LIMIT, CAMERA_PITCH_LIMIT), rotation.y,
             rotation.z);
}

void SceneStore::orbit_camera(double dx, double dy) {
    rotate_camera(math::add(scene_.camera.rotation, orbit_delta(dx, dy)));
}

void SceneStore::pan_camera(const Vec3& offset) {
    scene_.camera.position = math::add(scene_.camera.position, offset);
}

void SceneStore::zoom_camera(double delta) {
    scene_.camera.position.z = math::clamp(scene_.camera.position.z + delta,
                                           MIN_CAMERA_DISTANCE, MAX_CAMERA_DISTANCE);
}

void SceneStore::reset_camera() {
    scene_.camera = default_camera();
}

void SceneStore::move_cursor_3d(const Vec3& position) {
    scene_.cursor_3d = position;
}

void SceneStore::toggle_grid() {
    scene_.grid_visible = !scene_.grid_visible;
}

void SceneStore::toggle_axis() {
    scene_.axis_visible = !scene_.axis_visible;
}

void SceneStore::set_lighting_mode(LightingMode mode) {
    scene_.lighting_mode = mode;
    scene_.lights = lights_for_mode(mode);
    spdlog::debug("[Scene Store] Lighting mode: {}", lighting_mode_name(mode));
}

} // namespace facet
