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

#include "scene_io.h"

#include "scene_store.h"

#include <spdlog/spdlog.h>

#include <fstream>

namespace {

using facet::json;
using facet::Vec3;

constexpr int JSON_INDENT = 2;

// Missing components keep the fallback value
Vec3 vec3_from_json(const json& j, const Vec3& fallback) {
    Vec3 v = fallback;
    if (j.contains("x"))
        v.x = j["x"].get<double>();
    if (j.contains("y"))
        v.y = j["y"].get<double>();
    if (j.contains("z"))
        v.z = j["z"].get<double>();
    return v;
}

json vec3_to_json(const Vec3& v) {
    return json{{"x", v.x}, {"y", v.y}, {"z", v.z}};
}

template <typename T> void read_if_present(const json& j, const char* key, T& out) {
    if (j.contains(key)) {
        out = j[key].get<T>();
    }
}

facet::Material material_from_json(const json& j) {
    facet::Material material;
    read_if_present(j, "id", material.id);
    read_if_present(j, "color", material.color);
    read_if_present(j, "ambient", material.ambient);
    read_if_present(j, "diffuse", material.diffuse);
    read_if_present(j, "specular", material.specular);
    read_if_present(j, "shininess", material.shininess);
    return material;
}

json material_to_json(const facet::Material& material) {
    return json{{"id", material.id},
                {"color", material.color},
                {"ambient", material.ambient},
                {"diffuse", material.diffuse},
                {"specular", material.specular},
                {"shininess", material.shininess}};
}

facet::SceneObject object_from_json(const json& j) {
    facet::SceneObject object;
    read_if_present(j, "id", object.id);
    read_if_present(j, "name", object.name);

    if (j.contains("type")) {
        std::string type = j["type"].get<std::string>();
        auto kind = facet::parse_primitive_kind(type);
        if (kind) {
            object.kind = *kind;
        } else {
            spdlog::warn("[Scene IO] Object '{}' has unknown type '{}', loading as box", object.id,
                         type);
            object.kind = facet::PrimitiveKind::BOX;
        }
    }

    if (j.contains("position"))
        object.position = vec3_from_json(j["position"], object.position);
    if (j.contains("rotation"))
        object.rotation = vec3_from_json(j["rotation"], object.rotation);
    if (j.contains("scale"))
        object.scale = vec3_from_json(j["scale"], object.scale);
    if (j.contains("material"))
        object.material = material_from_json(j["material"]);
    read_if_present(j, "visible", object.visible);
    read_if_present(j, "locked", object.locked);
    return object;
}

json object_to_json(const facet::SceneObject& object) {
    return json{{"id", object.id},
                {"name", object.name},
                {"type", facet::primitive_kind_name(object.kind)},
                {"position", vec3_to_json(object.position)},
                {"rotation", vec3_to_json(object.rotation)},
                {"scale", vec3_to_json(object.scale)},
                {"material", material_to_json(object.material)},
                {"visible", object.visible},
                {"locked", object.locked}};
}

std::optional<facet::Light> light_from_json(const json& j) {
    std::string type = j.value("type", std::string("ambient"));

    facet::Light light;
    if (type == "ambient") {
        light.kind = facet::LightKind::AMBIENT;
    } else if (type == "directional") {
        light.kind = facet::LightKind::DIRECTIONAL;
    } else {
        spdlog::warn("[Scene IO] Skipping light with unknown type '{}'", type);
        return std::nullopt;
    }

    read_if_present(j, "color", light.color);
    read_if_present(j, "intensity", light.intensity);
    if (j.contains("direction"))
        light.direction = vec3_from_json(j["direction"], light.direction);
    return light;
}

json light_to_json(const facet::Light& light) {
    json j{{"type", light.kind == facet::LightKind::AMBIENT ? "ambient" : "directional"},
           {"color", light.color},
           {"intensity", light.intensity}};
    if (light.kind == facet::LightKind::DIRECTIONAL) {
        j["direction"] = vec3_to_json(light.direction);
    }
    return j;
}

facet::Camera camera_from_json(const json& j) {
    facet::Camera camera = facet::default_camera();
    if (j.contains("position"))
        camera.position = vec3_from_json(j["position"], camera.position);
    if (j.contains("rotation"))
        camera.rotation = vec3_from_json(j["rotation"], camera.rotation);
    read_if_present(j, "fov", camera.fov);
    read_if_present(j, "near", camera.near_plane);
    read_if_present(j, "far", camera.far_plane);
    return camera;
}

json camera_to_json(const facet::Camera& camera) {
    return json{{"position", vec3_to_json(camera.position)},
                {"rotation", vec3_to_json(camera.rotation)},
                {"fov", camera.fov},
                {"near", camera.near_plane},
                {"far", camera.far_plane}};
}

} // anonymous namespace

namespace facet {

// ============================================================================
// Engine config
// ============================================================================

bool engine_config_from_json(const json& j, EngineConfig& config) {
    try {
        if (!j.is_object()) {
            spdlog::error("[Scene IO] Engine config must be a JSON object");
            return false;
        }
        read_if_present(j, "fov", config.fov);
        read_if_present(j, "camera_distance", config.camera_distance);
        read_if_present(j, "ambient_intensity", config.ambient_intensity);
        read_if_present(j, "directional_intensity", config.directional_intensity);
        if (j.contains("light_direction")) {
            config.light_direction = vec3_from_json(j["light_direction"], config.light_direction);
        }
        read_if_present(j, "primitive_size", config.primitive_size);
        read_if_present(j, "visibility_epsilon", config.visibility_epsilon);
        return true;
    } catch (const std::exception& e) {
        spdlog::error("[Scene IO] Invalid engine config: {}", e.what());
        return false;
    }
}

json engine_config_to_json(const EngineConfig& config) {
    return json{{"fov", config.fov},
                {"camera_distance", config.camera_distance},
                {"ambient_intensity", config.ambient_intensity},
                {"directional_intensity", config.directional_intensity},
                {"light_direction", vec3_to_json(config.light_direction)},
                {"primitive_size", config.primitive_size},
                {"visibility_epsilon", config.visibility_epsilon}};
}

std::optional<EngineConfig> load_engine_config(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        spdlog::error("[Scene IO] Failed to open engine config {}", path);
        return std::nullopt;
    }

    try {
        json data = json::parse(file);
        EngineConfig config;
        if (!engine_config_from_json(data, config)) {
            return std::nullopt;
        }
        spdlog::info("[Scene IO] Loaded engine config from {}", path);
        return config;
    } catch (const std::exception& e) {
        spdlog::error("[Scene IO] Failed to parse engine config {}: {}", path, e.what());
        return std::nullopt;
    }
}

// ============================================================================
// Scenes
// ============================================================================

std::optional<Scene> scene_from_json(const json& j) {
    try {
        if (!j.is_object()) {
            spdlog::error("[Scene IO] Scene must be a JSON object");
            return std::nullopt;
        }

        Scene scene;
        scene.camera = default_camera();

        for (const char* key : {"objects", "lights"}) {
            if (j.contains(key) && !j[key].is_array()) {
                spdlog::error("[Scene IO] Scene '{}' must be a JSON array", key);
                return std::nullopt;
            }
        }

        if (j.contains("objects")) {
            for (const auto& item : j["objects"]) {
                scene.objects.push_back(object_from_json(item));
            }
        }
        if (j.contains("lights")) {
            for (const auto& item : j["lights"]) {
                auto light = light_from_json(item);
                if (light) {
                    scene.lights.push_back(*light);
                }
            }
        }
        if (j.contains("camera"))
            scene.camera = camera_from_json(j["camera"]);
        if (j.contains("cursor3D"))
            scene.cursor_3d = vec3_from_json(j["cursor3D"], scene.cursor_3d);
        if (j.contains("selectedObjectId") && !j["selectedObjectId"].is_null())
            scene.selected_object_id = j["selectedObjectId"].get<std::string>();
        read_if_present(j, "gridVisible", scene.grid_visible);
        read_if_present(j, "axisVisible", scene.axis_visible);

        if (j.contains("lightingMode")) {
            std::string mode = j["lightingMode"].get<std::string>();
            auto parsed = parse_lighting_mode(mode);
            if (parsed) {
                scene.lighting_mode = *parsed;
            } else {
                spdlog::warn("[Scene IO] Unknown lighting mode '{}', keeping {}", mode,
                             lighting_mode_name(scene.lighting_mode));
            }
        }

        spdlog::debug("[Scene IO] Parsed scene: {} objects, {} lights", scene.objects.size(),
                      scene.lights.size());
        return scene;
    } catch (const std::exception& e) {
        spdlog::error("[Scene IO] Invalid scene: {}", e.what());
        return std::nullopt;
    }
}

json scene_to_json(const Scene& scene) {
    json objects = json::array();
    for (const auto& object : scene.objects) {
        objects.push_back(object_to_json(object));
    }

    json lights = json::array();
    for (const auto& light : scene.lights) {
        lights.push_back(light_to_json(light));
    }

    json j{{"objects", objects},
           {"lights", lights},
           {"camera", camera_to_json(scene.camera)},
           {"cursor3D", vec3_to_json(scene.cursor_3d)},
           {"gridVisible", scene.grid_visible},
           {"axisVisible", scene.axis_visible},
           {"lightingMode", lighting_mode_name(scene.lighting_mode)}};
    j["selectedObjectId"] =
        scene.selected_object_id ? json(*scene.selected_object_id) : json(nullptr);
    return j;
}

std::optional<Scene> load_scene_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        spdlog::error("[Scene IO] Failed to open scene {}", path);
        return std::nullopt;
    }

    json data;
    try {
        data = json::parse(file);
    } catch (const std::exception& e) {
        spdlog::error("[Scene IO] Failed to parse scene {}: {}", path, e.what());
        return std::nullopt;
    }

    auto scene = scene_from_json(data);
    if (scene) {
        spdlog::info("[Scene IO] Loaded scene {} ({} objects)", path, scene->objects.size());
    }
    return scene;
}

bool save_scene_file(const Scene& scene, const std::string& path) {
    std::ofstream file(path);
    if (!file.is_open()) {
        spdlog::error("[Scene IO] Failed to open {} for writing", path);
        return false;
    }

    file << scene_to_json(scene).dump(JSON_INDENT) << "\n";
    if (!file.good()) {
        spdlog::error("[Scene IO] Failed to write scene {}", path);
        return false;
    }

    spdlog::info("[Scene IO] Saved scene to {}", path);
    return true;
}

} // namespace facet
