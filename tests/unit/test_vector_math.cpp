// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2025 Facet Contributors
 */

#include "vector_math.h"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <cmath>

using namespace facet;
using Catch::Approx;
using Catch::Matchers::WithinAbs;

static void require_vec_near(const Vec3& actual, const Vec3& expected, double eps = 1e-9) {
    REQUIRE_THAT(actual.x, WithinAbs(expected.x, eps));
    REQUIRE_THAT(actual.y, WithinAbs(expected.y, eps));
    REQUIRE_THAT(actual.z, WithinAbs(expected.z, eps));
}

TEST_CASE("VectorMath - Basic algebra", "[math]") {
    Vec3 a(1.0, 2.0, 3.0);
    Vec3 b(4.0, -5.0, 6.0);

    SECTION("Add and subtract") {
        require_vec_near(math::add(a, b), Vec3(5.0, -3.0, 9.0));
        require_vec_near(math::subtract(a, b), Vec3(-3.0, 7.0, -3.0));
    }

    SECTION("Scalar multiply and divide") {
        require_vec_near(math::multiply(a, 2.0), Vec3(2.0, 4.0, 6.0));
        require_vec_near(math::divide(a, 2.0), Vec3(0.5, 1.0, 1.5));
        require_vec_near(math::multiply_components(a, b), Vec3(4.0, -10.0, 18.0));
    }

    SECTION("Dot and cross") {
        REQUIRE(math::dot(a, b) == Approx(12.0));
        require_vec_near(math::cross(Vec3(1.0, 0.0, 0.0), Vec3(0.0, 1.0, 0.0)),
                         Vec3(0.0, 0.0, 1.0));
        Vec3 c = math::cross(a, b);
        REQUIRE(math::dot(c, a) == Approx(0.0).margin(1e-12));
        REQUIRE(math::dot(c, b) == Approx(0.0).margin(1e-12));
    }

    SECTION("Length") {
        REQUIRE(math::length(Vec3(3.0, 4.0, 0.0)) == Approx(5.0));
    }
}

TEST_CASE("VectorMath - Normalize", "[math]") {
    SECTION("Non-zero vectors become unit length") {
        Vec3 vectors[] = {Vec3(3.0, 4.0, 0.0), Vec3(-1.0, 1.0, 1.0), Vec3(0.0, 0.0, 1e-6),
                          Vec3(1e6, -2e6, 3e6)};
        for (const auto& v : vectors) {
            REQUIRE(math::length(math::normalize(v)) == Approx(1.0));
        }
    }

    SECTION("Zero vector stays zero") {
        Vec3 n = math::normalize(Vec3(0.0, 0.0, 0.0));
        REQUIRE(n.x == 0.0);
        REQUIRE(n.y == 0.0);
        REQUIRE(n.z == 0.0);
    }
}

TEST_CASE("VectorMath - Axis rotations", "[math][rotation]") {
    SECTION("Right-handed quarter turns") {
        require_vec_near(math::rotate_x(Vec3(0.0, 1.0, 0.0), M_PI / 2.0), Vec3(0.0, 0.0, 1.0));
        require_vec_near(math::rotate_y(Vec3(0.0, 0.0, 1.0), M_PI / 2.0), Vec3(1.0, 0.0, 0.0));
        require_vec_near(math::rotate_z(Vec3(1.0, 0.0, 0.0), M_PI / 2.0), Vec3(0.0, 1.0, 0.0));
    }

    SECTION("Rotation by -angle undoes rotation by angle") {
        Vec3 v(12.5, -3.0, 7.25);
        for (double angle : {0.1, 0.7, 2.5, -1.3}) {
            require_vec_near(math::rotate_x(math::rotate_x(v, angle), -angle), v);
            require_vec_near(math::rotate_y(math::rotate_y(v, angle), -angle), v);
            require_vec_near(math::rotate_z(math::rotate_z(v, angle), -angle), v);
        }
    }

    SECTION("Rotations preserve length") {
        Vec3 v(1.0, 2.0, 3.0);
        REQUIRE(math::length(math::rotate_euler(v, Vec3(0.3, -1.1, 2.0))) ==
                Approx(math::length(v)));
    }
}

TEST_CASE("VectorMath - Euler rotation order", "[math][rotation]") {
    Vec3 v(1.0, 2.0, 3.0);
    Vec3 r(0.4, -0.5, 0.25);

    SECTION("Applies X, then Y, then Z") {
        Vec3 expected = math::rotate_z(math::rotate_y(math::rotate_x(v, r.x), r.y), r.z);
        require_vec_near(math::rotate_euler(v, r), expected);
    }

    SECTION("Inverse is per-axis in reverse order") {
        Vec3 rotated = math::rotate_euler(v, r);
        Vec3 back = math::rotate_x(math::rotate_y(math::rotate_z(rotated, -r.z), -r.y), -r.x);
        require_vec_near(back, v);
    }

    SECTION("Zero rotation is identity") {
        require_vec_near(math::rotate_euler(v, Vec3(0.0, 0.0, 0.0)), v);
    }
}

TEST_CASE("VectorMath - Interpolation and clamping", "[math]") {
    REQUIRE(math::lerp(10.0, 20.0, 0.25) == Approx(12.5));
    require_vec_near(math::lerp(Vec3(0.0, 0.0, 0.0), Vec3(10.0, -10.0, 4.0), 0.5),
                     Vec3(5.0, -5.0, 2.0));

    REQUIRE(math::clamp(5.0, 0.0, 1.0) == 1.0);
    REQUIRE(math::clamp(-5.0, 0.0, 1.0) == 0.0);
    REQUIRE(math::clamp(0.3, 0.0, 1.0) == 0.3);
}

TEST_CASE("VectorMath - Grid snapping", "[math][grid]") {
    SECTION("Rounds to nearest multiple") {
        REQUIRE(math::snap_to_grid(12.0, 5.0) == Approx(10.0));
        REQUIRE(math::snap_to_grid(13.0, 5.0) == Approx(15.0));
        REQUIRE(math::snap_to_grid(-12.0, 5.0) == Approx(-10.0));
    }

    SECTION("Halves round up") {
        REQUIRE(math::snap_to_grid(2.5, 5.0) == Approx(5.0));
        REQUIRE(math::snap_to_grid(-2.5, 5.0) == Approx(0.0));
    }

    SECTION("Non-positive grid disables snapping") {
        REQUIRE(math::snap_to_grid(3.3, 0.0) == 3.3);
        REQUIRE(math::snap_to_grid(3.3, -1.0) == 3.3);
    }

    SECTION("Vector snaps each component") {
        require_vec_near(math::snap_to_grid(Vec3(1.2, 7.9, -4.4), 2.0), Vec3(2.0, 8.0, -4.0));
    }
}

TEST_CASE("VectorMath - Axis constraints", "[math]") {
    Vec3 d(1.0, 2.0, 3.0);

    require_vec_near(math::constrain_to_axis(d, math::AxisConstraint::X), Vec3(1.0, 0.0, 0.0));
    require_vec_near(math::constrain_to_axis(d, math::AxisConstraint::Y), Vec3(0.0, 2.0, 0.0));
    require_vec_near(math::constrain_to_axis(d, math::AxisConstraint::Z), Vec3(0.0, 0.0, 3.0));
    require_vec_near(math::constrain_to_axis(d, math::AxisConstraint::XY), Vec3(1.0, 2.0, 0.0));
    require_vec_near(math::constrain_to_axis(d, math::AxisConstraint::XZ), Vec3(1.0, 0.0, 3.0));
    require_vec_near(math::constrain_to_axis(d, math::AxisConstraint::YZ), Vec3(0.0, 2.0, 3.0));
    require_vec_near(math::constrain_to_axis(d, math::AxisConstraint::NONE), d);

    SECTION("Names round-trip through the parser") {
        for (auto axis : {math::AxisConstraint::X, math::AxisConstraint::Y,
                          math::AxisConstraint::Z, math::AxisConstraint::XY,
                          math::AxisConstraint::XZ, math::AxisConstraint::YZ,
                          math::AxisConstraint::NONE}) {
            REQUIRE(math::parse_axis_constraint(math::axis_constraint_name(axis)) == axis);
        }
        REQUIRE(math::parse_axis_constraint("diagonal") == math::AxisConstraint::NONE);
    }
}

TEST_CASE("VectorMath - Easing curves", "[math][easing]") {
    SECTION("Endpoints are fixed") {
        REQUIRE(math::ease_in_out(0.0) == Approx(0.0));
        REQUIRE(math::ease_in_out(1.0) == Approx(1.0));
        REQUIRE(math::ease_in_cubic(0.0) == Approx(0.0));
        REQUIRE(math::ease_in_cubic(1.0) == Approx(1.0));
        REQUIRE(math::ease_out_cubic(0.0) == Approx(0.0));
        REQUIRE(math::ease_out_cubic(1.0) == Approx(1.0));
    }

    SECTION("Shape") {
        REQUIRE(math::ease_in_out(0.5) == Approx(0.5));
        REQUIRE(math::ease_in_out(0.25) == Approx(0.125));
        REQUIRE(math::ease_in_cubic(0.5) == Approx(0.125));
        REQUIRE(math::ease_out_cubic(0.5) == Approx(0.875));
    }
}
