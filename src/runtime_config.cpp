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

#include "runtime_config.h"

#include "scene_store.h"

#include <spdlog/fmt/fmt.h>

#include <cstdio>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <cstring>

namespace {

facet::RuntimeConfig g_runtime_config;

constexpr const char* DEFAULT_FRAME_STEM = "out";
constexpr const char* SVG_EXTENSION = ".svg";

// Strict numeric parse: the whole argument must be consumed
bool parse_double(const char* text, double& out) {
    char* end = nullptr;
    double value = std::strtod(text, &end);
    if (end == text || *end != '\0') {
        return false;
    }
    out = value;
    return true;
}

bool parse_int(const char* text, int& out) {
    char* end = nullptr;
    errno = 0;
    long value = std::strtol(text, &end, 10);
    if (end == text || *end != '\0' || errno == ERANGE || value < INT_MIN || value > INT_MAX) {
        return false;
    }
    out = static_cast<int>(value);
    return true;
}

} // anonymous namespace

namespace facet {

std::string RuntimeConfig::frame_path(int frame) const {
    std::string stem = output_path.empty() ? DEFAULT_FRAME_STEM : output_path;
    const size_t ext_len = std::strlen(SVG_EXTENSION);
    if (stem.size() > ext_len && stem.compare(stem.size() - ext_len, ext_len, SVG_EXTENSION) == 0) {
        stem.erase(stem.size() - ext_len);
    }
    return fmt::format("{}_{:04d}{}", stem, frame, SVG_EXTENSION);
}

double RuntimeConfig::frame_time(int frame) const {
    return time + frame / fps;
}

void print_usage(const char* program) {
    printf("Usage: %s [options]\n", program);
    printf("Options:\n");
    printf("  -c, --config <file>      Engine config JSON (default: built-in defaults)\n");
    printf("  -i, --input <file>       Scene JSON (default: initial editor scene)\n");
    printf("  -o, --output <file>      SVG output file (default: stdout)\n");
    printf("  -W, --width <px>         Viewport width (default: 800)\n");
    printf("  -H, --height <px>        Viewport height (default: 600)\n");
    printf("  -t, --time <sec>         Animation time (default: 0)\n");
    printf("      --frames <n>         Write an n-frame sequence <output>_0000.svg ...\n");
    printf("      --fps <rate>         Sequence frame rate (default: 30)\n");
    printf("      --mode <mode>        solid, wireframe, normals (default: solid)\n");
    printf("      --select <id>        Highlight an object\n");
    printf("      --lighting <mode>    day, night (overrides the scene's lights)\n");
    printf("      --no-grid            Do not draw the floor grid\n");
    printf("      --save-scene <file>  Write the effective scene JSON\n");
    printf("      --log-target <t>     auto, syslog, file, console (default: console)\n");
    printf("  -v, -vv, -vvv            Increase log verbosity (info, debug, trace)\n");
    printf("  -h, --help               Show this help message\n");
}

ParseResult parse_command_line(int argc, const char* const* argv, RuntimeConfig& config) {
    auto require_value = [&](int& i, const char* name) -> const char* {
        if (i + 1 < argc) {
            return argv[++i];
        }
        fprintf(stderr, "Error: %s requires an argument\n", name);
        return nullptr;
    };

    for (int i = 1; i < argc; i++) {
        const char* arg = argv[i];

        if (strcmp(arg, "-c") == 0 || strcmp(arg, "--config") == 0) {
            const char* value = require_value(i, "-c/--config");
            if (!value)
                return ParseResult::ERROR;
            config.config_path = value;
        } else if (strcmp(arg, "-i") == 0 || strcmp(arg, "--input") == 0) {
            const char* value = require_value(i, "-i/--input");
            if (!value)
                return ParseResult::ERROR;
            config.scene_path = value;
        } else if (strcmp(arg, "-o") == 0 || strcmp(arg, "--output") == 0) {
            const char* value = require_value(i, "-o/--output");
            if (!value)
                return ParseResult::ERROR;
            config.output_path = value;
        } else if (strcmp(arg, "--save-scene") == 0) {
            const char* value = require_value(i, "--save-scene");
            if (!value)
                return ParseResult::ERROR;
            config.save_scene_path = value;
        } else if (strcmp(arg, "-W") == 0 || strcmp(arg, "--width") == 0 ||
                   strcmp(arg, "-H") == 0 || strcmp(arg, "--height") == 0) {
            bool is_width = arg[1] == 'W' || strcmp(arg, "--width") == 0;
            const char* value = require_value(i, is_width ? "-W/--width" : "-H/--height");
            if (!value)
                return ParseResult::ERROR;
            double size = 0.0;
            if (!parse_double(value, size) || size <= 0.0) {
                fprintf(stderr, "Invalid viewport size: %s\n", value);
                return ParseResult::ERROR;
            }
            (is_width ? config.width : config.height) = size;
        } else if (strcmp(arg, "-t") == 0 || strcmp(arg, "--time") == 0) {
            const char* value = require_value(i, "-t/--time");
            if (!value)
                return ParseResult::ERROR;
            if (!parse_double(value, config.time)) {
                fprintf(stderr, "Invalid time: %s\n", value);
                return ParseResult::ERROR;
            }
        } else if (strcmp(arg, "--frames") == 0) {
            const char* value = require_value(i, "--frames");
            if (!value)
                return ParseResult::ERROR;
            if (!parse_int(value, config.frames) || config.frames < 0) {
                fprintf(stderr, "Invalid frame count: %s\n", value);
                return ParseResult::ERROR;
            }
        } else if (strcmp(arg, "--fps") == 0) {
            const char* value = require_value(i, "--fps");
            if (!value)
                return ParseResult::ERROR;
            if (!parse_double(value, config.fps) || config.fps <= 0.0) {
                fprintf(stderr, "Invalid frame rate: %s\n", value);
                return ParseResult::ERROR;
            }
        } else if (strcmp(arg, "--mode") == 0) {
            const char* value = require_value(i, "--mode");
            if (!value)
                return ParseResult::ERROR;
            auto mode = svg::parse_render_mode(value);
            if (!mode) {
                fprintf(stderr, "Unknown render mode: %s\n", value);
                fprintf(stderr, "Available modes: solid, wireframe, normals\n");
                return ParseResult::ERROR;
            }
            config.render_mode = *mode;
        } else if (strcmp(arg, "--select") == 0) {
            const char* value = require_value(i, "--select");
            if (!value)
                return ParseResult::ERROR;
            config.select_id = std::string(value);
        } else if (strcmp(arg, "--lighting") == 0) {
            const char* value = require_value(i, "--lighting");
            if (!value)
                return ParseResult::ERROR;
            auto mode = parse_lighting_mode(value);
            if (!mode) {
                fprintf(stderr, "Unknown lighting mode: %s\n", value);
                fprintf(stderr, "Available modes: day, night\n");
                return ParseResult::ERROR;
            }
            config.lighting = *mode;
        } else if (strcmp(arg, "--no-grid") == 0) {
            config.draw_grid = false;
        } else if (strcmp(arg, "--log-target") == 0) {
            const char* value = require_value(i, "--log-target");
            if (!value)
                return ParseResult::ERROR;
            config.log_target = logging::parse_log_target(value);
        } else if (strcmp(arg, "-v") == 0 || strcmp(arg, "--verbose") == 0) {
            config.verbosity++;
        } else if (strcmp(arg, "-vv") == 0) {
            config.verbosity += 2;
        } else if (strcmp(arg, "-vvv") == 0) {
            config.verbosity += 3;
        } else if (strcmp(arg, "-h") == 0 || strcmp(arg, "--help") == 0) {
            print_usage(argv[0]);
            return ParseResult::HELP;
        } else {
            fprintf(stderr, "Unknown argument: %s\n", arg);
            fprintf(stderr, "Use --help for usage information\n");
            return ParseResult::ERROR;
        }
    }

    return ParseResult::OK;
}

const RuntimeConfig& get_runtime_config() {
    return g_runtime_config;
}

RuntimeConfig* get_mutable_runtime_config() {
    return &g_runtime_config;
}

} // namespace facet
