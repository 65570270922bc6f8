// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file facet_render.cpp
 * @brief Command-line renderer: scene JSON in, SVG out
 *
 * Usage: facet-render [-c config.json] [-i scene.json] [-o out.svg] [options]
 * Example: facet-render -i scene.json -W 1280 -H 720 --frames 60 -o anim.svg
 *
 * Without -i the editor's initial scene (cube, sphere, torus) is rendered.
 * Run with --help for the full option list.
 */

#include "logging_init.h"
#include "runtime_config.h"
#include "scene_io.h"
#include "scene_renderer.h"
#include "scene_store.h"
#include "svg_surface.h"

#include <spdlog/spdlog.h>

#include <fstream>
#include <iostream>

using namespace facet;

static bool write_output(const std::string& path, const std::string& svg) {
    if (path.empty()) {
        std::cout << svg;
        return static_cast<bool>(std::cout);
    }

    std::ofstream file(path);
    if (!file.is_open()) {
        spdlog::error("[facet-render] Failed to open {} for writing", path);
        return false;
    }
    file << svg;
    if (!file.good()) {
        spdlog::error("[facet-render] Failed to write {}", path);
        return false;
    }
    spdlog::info("[facet-render] Wrote {}", path);
    return true;
}

static std::string render_frame(const Scene& scene, const EngineConfig& engine,
                                const RuntimeConfig& options, double time) {
    RenderStats stats;
    std::vector<ProjectedFace> faces =
        render_scene(scene, engine, options.width, options.height, time, &stats);

    std::vector<svg::GridLine> grid;
    if (options.draw_grid && scene.grid_visible) {
        grid = svg::grid_floor_lines(scene.camera, engine.fov, options.width, options.height);
    }

    spdlog::debug("[facet-render] t={:.3f}: {} faces ({} culled)", time, stats.faces_emitted,
                  stats.faces_culled);
    return svg::render_svg(faces, options.width, options.height, options.render_mode, grid,
                           scene.axis_visible);
}

int main(int argc, char** argv) {
    RuntimeConfig* options = get_mutable_runtime_config();

    ParseResult parsed = parse_command_line(argc, argv, *options);
    if (parsed == ParseResult::HELP) {
        return 0;
    }
    if (parsed == ParseResult::ERROR) {
        return 1;
    }

    // Configure logging
    logging::LogConfig log_config;
    log_config.level = logging::level_from_verbosity(options->verbosity);
    log_config.target = options->log_target;
    logging::init(log_config);

    // Engine config
    EngineConfig engine;
    if (!options->config_path.empty()) {
        auto loaded = load_engine_config(options->config_path);
        if (!loaded) {
            return 1;
        }
        engine = *loaded;
    }

    // Scene
    SceneStore store;
    if (!options->scene_path.empty()) {
        auto loaded = load_scene_file(options->scene_path);
        if (!loaded) {
            return 1;
        }
        store.set_scene(*loaded);
    } else {
        Scene initial = create_initial_scene();
        initial.camera = default_camera(engine);
        store.set_scene(initial);
    }
    if (options->lighting) {
        store.set_lighting_mode(*options->lighting);
    }
    if (options->select_id && !store.select_object(*options->select_id)) {
        return 1;
    }

    if (!options->save_scene_path.empty() &&
        !save_scene_file(store.scene(), options->save_scene_path)) {
        return 1;
    }

    const RuntimeConfig& config = get_runtime_config();
    spdlog::info("[facet-render] {} objects, {}x{}, mode={}", store.scene().objects.size(),
                 config.width, config.height, svg::render_mode_name(config.render_mode));

    if (!config.is_sequence()) {
        std::string svg = render_frame(store.scene(), engine, config, config.time);
        return write_output(config.output_path, svg) ? 0 : 1;
    }

    for (int frame = 0; frame < config.frames; frame++) {
        std::string svg = render_frame(store.scene(), engine, config, config.frame_time(frame));
        if (!write_output(config.frame_path(frame), svg)) {
            return 1;
        }
    }
    spdlog::info("[facet-render] Wrote {} frames at {:.1f} fps", config.frames, config.fps);
    return 0;
}
