// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2025 Facet Contributors
 */

#include "transform_pipeline.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <cmath>

using namespace facet;
using Catch::Matchers::WithinAbs;

TEST_CASE("Transform - Object to world", "[transform]") {
    SECTION("Identity transform leaves points alone") {
        Vec3 p = transform::transform_point(Vec3(3.0, -4.0, 5.0), Vec3(0.0, 0.0, 0.0),
                                            Vec3(0.0, 0.0, 0.0), Vec3(1.0, 1.0, 1.0));
        REQUIRE_THAT(p.x, WithinAbs(3.0, 1e-12));
        REQUIRE_THAT(p.y, WithinAbs(-4.0, 1e-12));
        REQUIRE_THAT(p.z, WithinAbs(5.0, 1e-12));
    }

    SECTION("Scale, then rotate, then translate") {
        Vec3 p = transform::transform_point(Vec3(1.0, 0.0, 0.0), Vec3(10.0, 0.0, 0.0),
                                            Vec3(0.0, 0.0, M_PI / 2.0), Vec3(2.0, 1.0, 1.0));
        REQUIRE_THAT(p.x, WithinAbs(10.0, 1e-9));
        REQUIRE_THAT(p.y, WithinAbs(2.0, 1e-9));
        REQUIRE_THAT(p.z, WithinAbs(0.0, 1e-9));
    }

    SECTION("to_world applies the object transform to every vertex") {
        SceneObject object;
        object.position = Vec3(0.0, 5.0, 0.0);
        object.scale = Vec3(3.0, 3.0, 3.0);
        auto world = transform::to_world({Vec3(1.0, 0.0, 0.0), Vec3(0.0, 1.0, 0.0)}, object);
        REQUIRE(world.size() == 2);
        REQUIRE_THAT(world[0].x, WithinAbs(3.0, 1e-12));
        REQUIRE_THAT(world[0].y, WithinAbs(5.0, 1e-12));
        REQUIRE_THAT(world[1].y, WithinAbs(8.0, 1e-12));
    }
}

TEST_CASE("Transform - World to camera", "[transform]") {
    Camera camera;

    SECTION("Camera Z is not subtracted") {
        camera.position = Vec3(10.0, 20.0, 500.0);
        Vec3 p = transform::world_to_camera(Vec3(10.0, 20.0, 7.0), camera);
        REQUIRE_THAT(p.x, WithinAbs(0.0, 1e-12));
        REQUIRE_THAT(p.y, WithinAbs(0.0, 1e-12));
        REQUIRE_THAT(p.z, WithinAbs(7.0, 1e-12));
    }

    SECTION("Pan happens before rotation") {
        camera.position = Vec3(1.0, 0.0, 500.0);
        camera.rotation = Vec3(0.0, 0.0, M_PI / 2.0);
        Vec3 p = transform::world_to_camera(Vec3(2.0, 0.0, 0.0), camera);
        REQUIRE_THAT(p.x, WithinAbs(0.0, 1e-9));
        REQUIRE_THAT(p.y, WithinAbs(1.0, 1e-9));
    }

    SECTION("to_camera preserves vertex order") {
        auto out = transform::to_camera({Vec3(1.0, 0.0, 0.0), Vec3(2.0, 0.0, 0.0)}, camera);
        REQUIRE(out.size() == 2);
        REQUIRE(out[0].x < out[1].x);
    }
}
