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

#ifndef FACET_SCENE_RENDERER_H
#define FACET_SCENE_RENDERER_H

#include "scene_types.h"

#include <cstddef>
#include <vector>

/**
 * @file scene_renderer.h
 * @brief Scene snapshot → depth-sorted screen polygons
 *
 * Rendering pipeline, per visible object and per face:
 *
 * 1. Generate local-space faces (mesh_generator.h)
 * 2. Local → world → camera (transform_pipeline.h)
 * 3. Centroid and outward normal, backface cull (visibility.h)
 * 4. Light intensity and material tint (lighting.h)
 * 5. Perspective projection (projector.h)
 *
 * then one stable back-to-front sort over all faces (depth_sorter.h).
 *
 * The renderer is stateless. Every call regenerates meshes; the only value that
 * meaningfully crosses calls is the animation time passed in by the caller.
 */

namespace facet {

/**
 * @brief Per-call counters for diagnostics
 */
struct RenderStats {
    size_t objects_rendered = 0; ///< Visible objects whose mesh was generated
    size_t objects_skipped = 0;  ///< Objects with visible == false
    size_t faces_generated = 0;
    size_t faces_culled = 0;
    size_t faces_emitted = 0;

    /// Log the counters at debug level
    void log() const;
};

/**
 * @brief Fallback light rig built from the engine defaults
 *
 * White ambient at config.ambient_intensity plus a white directional light at
 * config.directional_intensity along config.light_direction. Used when the
 * scene carries no lights.
 */
std::vector<Light> default_lights(const EngineConfig& config);

/**
 * @brief Render a scene snapshot
 *
 * Projection uses config.fov and scene.camera.position.z as the camera
 * distance. Output is a pure function of the arguments.
 *
 * @param scene Scene to render (read only)
 * @param config Engine parameters
 * @param width Viewport width in pixels (must be > 0)
 * @param height Viewport height in pixels (must be > 0)
 * @param time Animation time in seconds, consumed by volumetric kinds
 * @param stats Optional counters, overwritten when non-null
 * @return Faces in paint order (farthest first); empty for a non-positive viewport
 */
std::vector<ProjectedFace> render_scene(const Scene& scene, const EngineConfig& config,
                                        double width, double height, double time = 0.0,
                                        RenderStats* stats = nullptr);

} // namespace facet

#endif // FACET_SCENE_RENDERER_H
