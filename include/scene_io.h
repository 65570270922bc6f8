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

#ifndef FACET_SCENE_IO_H
#define FACET_SCENE_IO_H

#include "scene_types.h"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

/**
 * @file scene_io.h
 * @brief JSON engine configuration and scene files
 *
 * Engine config keys: fov, camera_distance, ambient_intensity,
 * directional_intensity, light_direction {x, y, z}, primitive_size,
 * visibility_epsilon. Missing keys keep their defaults.
 *
 * Scene files use the editor's camelCase layout:
 * ```json
 * {
 *   "objects": [{"id": "box-1", "name": "Cube 1", "type": "box",
 *                "position": {"x": 0, "y": 0, "z": 0}, ...}],
 *   "lights": [{"type": "ambient", "color": "#ffffff", "intensity": 0.6}],
 *   "camera": {"position": {...}, "rotation": {...}, "fov": 800, "near": 1, "far": 2000},
 *   "cursor3D": {...}, "selectedObjectId": null,
 *   "gridVisible": true, "axisVisible": true, "lightingMode": "night"
 * }
 * ```
 *
 * Loaders never throw: parse and type errors are logged and reported through
 * the return value.
 */

namespace facet {

using json = nlohmann::json;

/**
 * @brief Overlay config keys from a JSON object onto `config`
 * @return false on a type error (config may be partially updated)
 */
bool engine_config_from_json(const json& j, EngineConfig& config);

json engine_config_to_json(const EngineConfig& config);

/// Read an engine config file; std::nullopt if unreadable or malformed
std::optional<EngineConfig> load_engine_config(const std::string& path);

/**
 * @brief Build a scene from JSON
 *
 * Unknown primitive types load as boxes and unknown light types are skipped,
 * both with a warning.
 */
std::optional<Scene> scene_from_json(const json& j);

json scene_to_json(const Scene& scene);

std::optional<Scene> load_scene_file(const std::string& path);

/// Write the scene as indented JSON; false if the file cannot be written
bool save_scene_file(const Scene& scene, const std::string& path);

} // namespace facet

#endif // FACET_SCENE_IO_H
