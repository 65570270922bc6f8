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

#ifndef FACET_RUNTIME_CONFIG_H
#define FACET_RUNTIME_CONFIG_H

#include "logging_init.h"
#include "scene_types.h"
#include "svg_surface.h"

#include <optional>
#include <string>

namespace facet {

/**
 * @brief Command-line options of facet-render
 *
 * Filled once by parse_command_line() at startup and read through
 * get_runtime_config() afterwards.
 */
struct RuntimeConfig {
    std::string config_path;     ///< Engine config JSON (-c, empty = defaults)
    std::string scene_path;      ///< Scene JSON (-i, empty = initial editor scene)
    std::string output_path;     ///< SVG output (-o, empty = stdout)
    std::string save_scene_path; ///< Write the effective scene here (--save-scene)

    double width = 800.0;  ///< Viewport width (-W)
    double height = 600.0; ///< Viewport height (-H)
    double time = 0.0;     ///< Animation time in seconds (-t)

    int frames = 0;    ///< Animation frame count (--frames, 0 = single image)
    double fps = 30.0; ///< Frame rate for --frames

    svg::RenderMode render_mode = svg::RenderMode::SOLID; ///< --mode
    bool draw_grid = true;                                ///< Cleared by --no-grid

    std::optional<std::string> select_id;   ///< --select
    std::optional<LightingMode> lighting;   ///< --lighting

    int verbosity = 0;                                        ///< -v count
    logging::LogTarget log_target = logging::LogTarget::Console; ///< --log-target

    /**
     * @brief Check if an animation sequence was requested
     * @return true when --frames is positive
     */
    bool is_sequence() const {
        return frames > 0;
    }

    /**
     * @brief Output file for a frame of a sequence
     *
     * "out.svg" becomes "out_0000.svg", "out_0001.svg", ... A missing output
     * path uses "out" as the stem.
     */
    std::string frame_path(int frame) const;

    /// Animation time of a sequence frame: time + frame / fps
    double frame_time(int frame) const;
};

enum class ParseResult {
    OK,   ///< Continue running
    HELP, ///< Help printed; exit 0
    ERROR ///< Bad arguments; exit 1
};

/**
 * @brief Parse argv into `config`
 *
 * Errors are printed to stderr with a hint to use --help.
 */
ParseResult parse_command_line(int argc, const char* const* argv, RuntimeConfig& config);

/// Print usage to stdout
void print_usage(const char* program);

/**
 * @brief Get global runtime configuration
 * @return Reference to the global runtime configuration
 */
const RuntimeConfig& get_runtime_config();

/**
 * @brief Get mutable runtime configuration (for initialization only)
 * @return Pointer to the global runtime configuration
 */
RuntimeConfig* get_mutable_runtime_config();

} // namespace facet

#endif // FACET_RUNTIME_CONFIG_H
