// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2025 Facet Contributors
 */

#include "mesh_generator.h"
#include "visibility.h"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <cmath>
#include <set>
#include <tuple>

using namespace facet;
using Catch::Approx;
using Catch::Matchers::WithinAbs;

namespace {

// Raw winding normal must leave the face's anchor
void require_outward(const std::vector<Face>& faces) {
    for (size_t i = 0; i < faces.size(); i++) {
        const Face& face = faces[i];
        Vec3 normal = calculate_normal(face.vertices);
        Vec3 centroid = calculate_center(face.vertices);
        INFO("face " << i);
        REQUIRE(math::dot(normal, math::subtract(centroid, face.anchor)) > 0.0);
    }
}

size_t count_with_vertices(const std::vector<Face>& faces, size_t n) {
    size_t count = 0;
    for (const auto& face : faces) {
        if (face.vertices.size() == n) {
            count++;
        }
    }
    return count;
}

} // namespace

TEST_CASE("MeshGenerator - Box", "[mesh][box]") {
    auto faces = mesh::generate_box(50.0);

    SECTION("Six quads") {
        REQUIRE(faces.size() == 6);
        REQUIRE(count_with_vertices(faces, 4) == 6);
    }

    SECTION("Eight distinct corners at +-size/2") {
        std::set<std::tuple<double, double, double>> corners;
        for (const auto& face : faces) {
            for (const auto& v : face.vertices) {
                REQUIRE(std::fabs(v.x) == Approx(25.0));
                REQUIRE(std::fabs(v.y) == Approx(25.0));
                REQUIRE(std::fabs(v.z) == Approx(25.0));
                corners.insert(std::make_tuple(v.x, v.y, v.z));
            }
        }
        REQUIRE(corners.size() == 8);
    }

    SECTION("Outward winding") {
        require_outward(faces);
    }

    SECTION("Axis-aligned unit normals cover all six directions") {
        std::set<std::tuple<int, int, int>> normals;
        for (const auto& face : faces) {
            Vec3 n = calculate_normal(face.vertices);
            REQUIRE(math::length(n) == Approx(1.0));
            normals.insert(std::make_tuple(static_cast<int>(std::lround(n.x)),
                                           static_cast<int>(std::lround(n.y)),
                                           static_cast<int>(std::lround(n.z))));
        }
        REQUIRE(normals.size() == 6);
    }

    SECTION("Flat hex colours") {
        for (const auto& face : faces) {
            REQUIRE(face.color.size() == 7);
            REQUIRE(face.color[0] == '#');
        }
    }
}

TEST_CASE("MeshGenerator - Sphere", "[mesh][sphere]") {
    auto faces = mesh::generate_sphere(50.0, 16);

    SECTION("Quads in interior bands, triangles at the poles") {
        REQUIRE(faces.size() == 16 * 16);
        REQUIRE(count_with_vertices(faces, 3) == 2 * 16);
        REQUIRE(count_with_vertices(faces, 4) == 14 * 16);
    }

    SECTION("Vertices lie on the sphere") {
        for (const auto& face : faces) {
            for (const auto& v : face.vertices) {
                REQUIRE_THAT(math::length(v), WithinAbs(50.0, 1e-9));
            }
        }
    }

    SECTION("Outward winding") {
        require_outward(faces);
    }

    SECTION("HSL gradient by longitude and latitude") {
        REQUIRE(faces[0].color == "hsl(160, 100%, 40%)");
        // lat 8, lon 4 -> hue 160 + 60 * 4/16, lightness 40 + 20 * 8/16
        REQUIRE(faces[8 * 16 + 4].color == "hsl(175, 100%, 50%)");
    }

    SECTION("Too few segments are raised to the minimum") {
        auto coarse = mesh::generate_sphere(10.0, 1);
        REQUIRE(coarse.size() ==
                static_cast<size_t>(mesh::MIN_SEGMENTS * mesh::MIN_SEGMENTS));
    }
}

TEST_CASE("MeshGenerator - Cylinder, cone, torus, pyramid", "[mesh]") {
    SECTION("Cylinder: side quad plus two cap triangles per segment") {
        auto faces = mesh::generate_cylinder(30.0, 80.0, 16);
        REQUIRE(faces.size() == 48);
        REQUIRE(count_with_vertices(faces, 4) == 16);
        REQUIRE(count_with_vertices(faces, 3) == 32);
        require_outward(faces);
    }

    SECTION("Cone: side triangle plus base triangle per segment") {
        auto faces = mesh::generate_cone(40.0, 80.0, 16);
        REQUIRE(faces.size() == 32);
        REQUIRE(count_with_vertices(faces, 3) == 32);
        require_outward(faces);
    }

    SECTION("Torus: segments x segments quads") {
        auto faces = mesh::generate_torus(40.0, 15.0, 16);
        REQUIRE(faces.size() == 256);
        REQUIRE(count_with_vertices(faces, 4) == 256);
        require_outward(faces);
    }

    SECTION("Torus anchors sit on the tube core circle") {
        auto faces = mesh::generate_torus(40.0, 15.0, 16);
        for (const auto& face : faces) {
            REQUIRE_THAT(face.anchor.y, WithinAbs(0.0, 1e-12));
            REQUIRE_THAT(std::hypot(face.anchor.x, face.anchor.z), WithinAbs(40.0, 1e-9));
        }
    }

    SECTION("Torus normals point away from the tube core, not the object centre") {
        // Inner-ring faces face the origin, so an origin-based correction would flip them
        auto faces = mesh::generate_torus(40.0, 15.0, 16);
        size_t facing_origin = 0;
        for (const auto& face : faces) {
            Vec3 n = calculate_normal(face.vertices);
            if (math::dot(n, calculate_center(face.vertices)) < 0.0) {
                facing_origin++;
            }
        }
        REQUIRE(facing_origin > 0);
    }

    SECTION("Pyramid: four side triangles and a square base") {
        auto faces = mesh::generate_pyramid(50.0, 70.0);
        REQUIRE(faces.size() == 5);
        REQUIRE(count_with_vertices(faces, 3) == 4);
        REQUIRE(count_with_vertices(faces, 4) == 1);
        require_outward(faces);

        Vec3 base_normal = calculate_normal(faces[4].vertices);
        REQUIRE_THAT(base_normal.y, WithinAbs(-1.0, 1e-12));
    }
}

TEST_CASE("MeshGenerator - Kind dispatch", "[mesh][dispatch]") {
    SECTION("Size mapping") {
        REQUIRE(mesh::generate_primitive_faces(PrimitiveKind::BOX, 50.0).size() == 6);
        REQUIRE(mesh::generate_primitive_faces(PrimitiveKind::SPHERE, 50.0).size() == 256);
        REQUIRE(mesh::generate_primitive_faces(PrimitiveKind::CYLINDER, 50.0).size() == 48);
        REQUIRE(mesh::generate_primitive_faces(PrimitiveKind::TORUS, 50.0).size() == 256);
        REQUIRE(mesh::generate_primitive_faces(PrimitiveKind::CONE, 50.0).size() == 32);
        REQUIRE(mesh::generate_primitive_faces(PrimitiveKind::PYRAMID, 50.0).size() == 5);

        auto cylinder = mesh::generate_primitive_faces(PrimitiveKind::CYLINDER, 50.0);
        REQUIRE_THAT(cylinder[0].vertices[0].y, WithinAbs(40.0, 1e-9)); // 1.6 * 50 / 2
        REQUIRE_THAT(cylinder[0].vertices[0].x, WithinAbs(30.0, 1e-9)); // 0.6 * 50
    }

    SECTION("Every kind winds outward") {
        for (auto kind : {PrimitiveKind::BOX, PrimitiveKind::SPHERE, PrimitiveKind::CYLINDER,
                          PrimitiveKind::TORUS, PrimitiveKind::CONE, PrimitiveKind::PYRAMID,
                          PrimitiveKind::METABALLS, PrimitiveKind::FLUID_BLOB,
                          PrimitiveKind::CLOUD_VOLUME}) {
            INFO("kind " << primitive_kind_name(kind));
            auto faces = mesh::generate_primitive_faces(kind, 50.0, 0.8);
            REQUIRE_FALSE(faces.empty());
            require_outward(faces);
        }
    }

    SECTION("Generation is deterministic") {
        auto a = mesh::generate_primitive_faces(PrimitiveKind::TORUS, 50.0);
        auto b = mesh::generate_primitive_faces(PrimitiveKind::TORUS, 50.0);
        REQUIRE(a.size() == b.size());
        for (size_t i = 0; i < a.size(); i++) {
            REQUIRE(a[i].color == b[i].color);
            for (size_t k = 0; k < a[i].vertices.size(); k++) {
                REQUIRE(a[i].vertices[k] == b[i].vertices[k]);
            }
        }
    }

    SECTION("Out-of-range kind falls back to box") {
        auto faces = mesh::generate_primitive_faces(static_cast<PrimitiveKind>(99), 50.0);
        REQUIRE(faces.size() == 6);
    }
}

TEST_CASE("MeshGenerator - Kind names", "[mesh]") {
    REQUIRE(std::string(primitive_kind_name(PrimitiveKind::FLUID_BLOB)) == "fluidBlob");
    REQUIRE(std::string(primitive_kind_name(PrimitiveKind::CLOUD_VOLUME)) == "cloudVolume");
    REQUIRE(parse_primitive_kind("torus") == PrimitiveKind::TORUS);
    REQUIRE(parse_primitive_kind("metaballs") == PrimitiveKind::METABALLS);
    REQUIRE_FALSE(parse_primitive_kind("teapot").has_value());
    REQUIRE_FALSE(parse_primitive_kind("Box").has_value());

    REQUIRE(is_time_dependent(PrimitiveKind::METABALLS));
    REQUIRE(is_time_dependent(PrimitiveKind::FLUID_BLOB));
    REQUIRE(is_time_dependent(PrimitiveKind::CLOUD_VOLUME));
    REQUIRE_FALSE(is_time_dependent(PrimitiveKind::BOX));
    REQUIRE_FALSE(is_time_dependent(PrimitiveKind::TORUS));
}

TEST_CASE("MeshGenerator - HSL formatting", "[mesh]") {
    REQUIRE(mesh::hsl_color(180.0, 100.0, 50.0) == "hsl(180, 100%, 50%)");
    REQUIRE(mesh::hsl_color(172.5, 100.0, 47.5) == "hsl(172.5, 100%, 47.5%)");
}
