// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2025 Facet Contributors
 */

#include "runtime_config.h"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace facet;
using Catch::Approx;

TEST_CASE("Runtime config - Defaults", "[cli]") {
    const char* argv[] = {"facet-render"};
    RuntimeConfig config;

    REQUIRE(parse_command_line(1, argv, config) == ParseResult::OK);
    REQUIRE(config.width == 800.0);
    REQUIRE(config.height == 600.0);
    REQUIRE(config.output_path.empty());
    REQUIRE(config.render_mode == svg::RenderMode::SOLID);
    REQUIRE(config.draw_grid);
    REQUIRE_FALSE(config.is_sequence());
    REQUIRE(config.log_target == logging::LogTarget::Console);
}

TEST_CASE("Runtime config - Options", "[cli]") {
    const char* argv[] = {"facet-render", "-i",         "scene.json", "-o",       "out.svg",
                          "-W",           "1024",       "-H",         "768",      "-t",
                          "1.5",          "--mode",     "wireframe",  "--select", "torus-1",
                          "--lighting",   "day",        "--no-grid",  "-vv",      "--log-target",
                          "file"};
    RuntimeConfig config;

    REQUIRE(parse_command_line(21, argv, config) == ParseResult::OK);
    REQUIRE(config.scene_path == "scene.json");
    REQUIRE(config.output_path == "out.svg");
    REQUIRE(config.width == 1024.0);
    REQUIRE(config.height == 768.0);
    REQUIRE(config.time == Approx(1.5));
    REQUIRE(config.render_mode == svg::RenderMode::WIREFRAME);
    REQUIRE(config.select_id == std::string("torus-1"));
    REQUIRE(config.lighting == LightingMode::DAY);
    REQUIRE_FALSE(config.draw_grid);
    REQUIRE(config.verbosity == 2);
    REQUIRE(config.log_target == logging::LogTarget::File);
}

TEST_CASE("Runtime config - Errors", "[cli]") {
    RuntimeConfig config;

    SECTION("Missing value") {
        const char* argv[] = {"facet-render", "-o"};
        REQUIRE(parse_command_line(2, argv, config) == ParseResult::ERROR);
    }

    SECTION("Unknown argument") {
        const char* argv[] = {"facet-render", "--teapot"};
        REQUIRE(parse_command_line(2, argv, config) == ParseResult::ERROR);
    }

    SECTION("Bad numbers") {
        const char* width[] = {"facet-render", "-W", "wide"};
        REQUIRE(parse_command_line(3, width, config) == ParseResult::ERROR);
        const char* zero[] = {"facet-render", "-H", "0"};
        REQUIRE(parse_command_line(3, zero, config) == ParseResult::ERROR);
        const char* frames[] = {"facet-render", "--frames", "-2"};
        REQUIRE(parse_command_line(3, frames, config) == ParseResult::ERROR);
    }

    SECTION("Unknown modes") {
        const char* mode[] = {"facet-render", "--mode", "xray"};
        REQUIRE(parse_command_line(3, mode, config) == ParseResult::ERROR);
        const char* lighting[] = {"facet-render", "--lighting", "dusk"};
        REQUIRE(parse_command_line(3, lighting, config) == ParseResult::ERROR);
    }

    SECTION("Help") {
        const char* argv[] = {"facet-render", "--help"};
        REQUIRE(parse_command_line(2, argv, config) == ParseResult::HELP);
    }
}

TEST_CASE("Runtime config - Animation sequences", "[cli][frames]") {
    RuntimeConfig config;
    const char* argv[] = {"facet-render", "--frames", "3", "--fps", "10", "-t", "2"};
    REQUIRE(parse_command_line(7, argv, config) == ParseResult::OK);
    REQUIRE(config.is_sequence());

    SECTION("Frame times advance by 1 / fps") {
        REQUIRE(config.frame_time(0) == Approx(2.0));
        REQUIRE(config.frame_time(2) == Approx(2.2));
    }

    SECTION("Frame paths") {
        REQUIRE(config.frame_path(0) == "out_0000.svg");
        config.output_path = "renders/spin.svg";
        REQUIRE(config.frame_path(12) == "renders/spin_0012.svg");
        config.output_path = "noext";
        REQUIRE(config.frame_path(1) == "noext_0001.svg");
    }
}

TEST_CASE("Runtime config - Out-of-range frame counts", "[cli][frames]") {
    RuntimeConfig config;
    const char* huge[] = {"facet-render", "--frames", "99999999999999999999"};
    REQUIRE(parse_command_line(3, huge, config) == ParseResult::ERROR);
    const char* wraps[] = {"facet-render", "--frames", "4294967297"};
    REQUIRE(parse_command_line(3, wraps, config) == ParseResult::ERROR);
    REQUIRE(config.frames == 0);
}
