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

#include "scene_renderer.h"

#include "depth_sorter.h"
#include "lighting.h"
#include "mesh_generator.h"
#include "projector.h"
#include "transform_pipeline.h"
#include "visibility.h"

#include <spdlog/spdlog.h>

#include <chrono>

namespace facet {

void RenderStats::log() const {
    spdlog::debug("[Scene Renderer] Objects: {} rendered, {} skipped | Faces: {} generated, {} "
                  "culled, {} emitted",
                  objects_rendered, objects_skipped, faces_generated, faces_culled, faces_emitted);
}

std::vector<Light> default_lights(const EngineConfig& config) {
    Light ambient;
    ambient.kind = LightKind::AMBIENT;
    ambient.color = "#ffffff";
    ambient.intensity = config.ambient_intensity;

    Light directional;
    directional.kind = LightKind::DIRECTIONAL;
    directional.color = "#ffffff";
    directional.intensity = config.directional_intensity;
    directional.direction = config.light_direction;

    return {ambient, directional};
}

std::vector<ProjectedFace> render_scene(const Scene& scene, const EngineConfig& config,
                                        double width, double height, double time,
                                        RenderStats* stats) {
    RenderStats local_stats;
    std::vector<ProjectedFace> faces;

    if (width <= 0.0 || height <= 0.0) {
        spdlog::warn("[Scene Renderer] Cannot render: invalid viewport {}x{}", width, height);
        if (stats) {
            *stats = local_stats;
        }
        return faces;
    }

    // PERF: Track rendering pipeline timings
    auto t_start = std::chrono::high_resolution_clock::now();

    const Camera& camera = scene.camera;
    const double camera_distance = camera.position.z;
    const std::vector<Light> fallback_lights =
        scene.lights.empty() ? default_lights(config) : std::vector<Light>{};
    const std::vector<Light>& lights = scene.lights.empty() ? fallback_lights : scene.lights;

    for (const auto& object : scene.objects) {
        if (!object.visible) {
            local_stats.objects_skipped++;
            continue;
        }
        local_stats.objects_rendered++;

        const bool selected =
            scene.selected_object_id && *scene.selected_object_id == object.id;
        const std::vector<Face> local_faces =
            mesh::generate_primitive_faces(object.kind, config.primitive_size, time);
        local_stats.faces_generated += local_faces.size();

        for (const auto& face : local_faces) {
            std::vector<Vec3> camera_vertices =
                transform::to_camera(transform::to_world(face.vertices, object), camera);

            Vec3 center = calculate_center(camera_vertices);
            Vec3 anchor = transform::world_to_camera(
                transform::transform_point(face.anchor, object.position, object.rotation,
                                           object.scale),
                camera);
            Vec3 normal = orient_outward(calculate_normal(camera_vertices), center, anchor);

            if (!is_face_visible(normal, center, camera_distance, config.visibility_epsilon)) {
                local_stats.faces_culled++;
                continue;
            }

            ProjectedFace projected;
            projected.light_intensity = calculate_lighting(normal, lights, camera.rotation);

            const std::string& base_color =
                object.material.color.empty() ? face.color : object.material.color;
            projected.color = apply_lighting_to_color(base_color, projected.light_intensity);

            projected.projected.reserve(camera_vertices.size());
            for (const auto& v : camera_vertices) {
                projected.projected.push_back(
                    project(v, width, height, config.fov, camera_distance));
            }

            projected.depth = face_depth(camera_vertices);
            projected.normal = normal;
            projected.object_id = object.id;
            projected.is_selected = selected;
            projected.vertices = std::move(camera_vertices);
            faces.push_back(std::move(projected));
        }
    }
    auto t_build = std::chrono::high_resolution_clock::now();

    // Painter's algorithm: furthest first
    sort_faces_by_depth(faces);
    auto t_sort = std::chrono::high_resolution_clock::now();

    local_stats.faces_emitted = faces.size();

    // PERF: Log performance breakdown (use -vvv to see)
    auto ms_build = std::chrono::duration<double, std::milli>(t_build - t_start).count();
    auto ms_sort = std::chrono::duration<double, std::milli>(t_sort - t_build).count();
    spdlog::trace("[PERF] Render t={:.3f}: {:.2f}ms total | Build: {:.2f}ms | Sort: {:.2f}ms | "
                  "{} faces",
                  time, ms_build + ms_sort, ms_build, ms_sort, faces.size());
    local_stats.log();

    if (stats) {
        *stats = local_stats;
    }
    return faces;
}

} // namespace facet
