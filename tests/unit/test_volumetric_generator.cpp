// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2025 Facet Contributors
 */

#include "volumetric_generator.h"
#include "visibility.h"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <algorithm>
#include <cmath>

using namespace facet;
using Catch::Approx;
using Catch::Matchers::WithinAbs;

TEST_CASE("Volumetric - Metaball field", "[mesh][metaballs]") {
    auto blobs = mesh::metaball_blobs(50.0, 0.0);
    REQUIRE(blobs.size() == static_cast<size_t>(mesh::METABALL_COUNT));

    SECTION("Blobs stay near the origin") {
        for (double t : {0.0, 1.0, 2.5, 10.0}) {
            for (const auto& blob : mesh::metaball_blobs(50.0, t)) {
                REQUIRE(std::fabs(blob.center.x) <= 0.35 * 50.0 + 1e-9);
                REQUIRE(std::fabs(blob.center.y) <= 0.25 * 50.0 + 1e-9);
                REQUIRE(std::fabs(blob.center.z) <= 0.35 * 50.0 + 1e-9);
                REQUIRE(blob.radius > 0.0);
            }
        }
    }

    SECTION("Inside at a blob centre, outside far away") {
        REQUIRE(mesh::metaball_field(blobs[0].center, blobs) >= mesh::METABALL_THRESHOLD);
        REQUIRE(mesh::metaball_field(Vec3(500.0, 500.0, 500.0), blobs) <
                mesh::METABALL_THRESHOLD);
    }

    SECTION("Single blob field is r^2 / d^2") {
        std::vector<mesh::MetaballBlob> one = {{Vec3(0.0, 0.0, 0.0), 10.0}};
        REQUIRE(mesh::metaball_field(Vec3(20.0, 0.0, 0.0), one) == Approx(0.25));
        REQUIRE(std::isfinite(mesh::metaball_field(Vec3(0.0, 0.0, 0.0), one)));
    }
}

TEST_CASE("Volumetric - Metaball surface quads", "[mesh][metaballs]") {
    auto faces = mesh::generate_metaballs(50.0, 0.0);

    SECTION("Produces a surface") {
        REQUIRE_FALSE(faces.empty());
        // Far fewer than the full grid: only cells straddling the isosurface emit
        REQUIRE(faces.size() < static_cast<size_t>(12 * 12 * 12));
    }

    SECTION("Axis-aligned quads of one cell inside the sampled volume") {
        const double cell = 100.0 / 12.0;
        for (const auto& face : faces) {
            REQUIRE(face.vertices.size() == 4);
            Vec3 n = calculate_normal(face.vertices);
            double largest = std::max({std::fabs(n.x), std::fabs(n.y), std::fabs(n.z)});
            REQUIRE(largest == Approx(1.0));
            REQUIRE(math::length(math::subtract(face.vertices[1], face.vertices[0])) ==
                    Approx(cell));
            for (const auto& v : face.vertices) {
                REQUIRE(std::fabs(v.x) <= 50.0 + 1e-9);
                REQUIRE(std::fabs(v.y) <= 50.0 + 1e-9);
                REQUIRE(std::fabs(v.z) <= 50.0 + 1e-9);
            }
        }
    }

    SECTION("Quads face down the field gradient") {
        auto blobs = mesh::metaball_blobs(50.0, 0.0);
        for (const auto& face : faces) {
            Vec3 c = calculate_center(face.vertices);
            Vec3 n = calculate_normal(face.vertices);
            Vec3 step = math::multiply(n, 100.0 / 24.0);
            REQUIRE(mesh::metaball_field(math::add(c, step), blobs) <
                    mesh::metaball_field(math::subtract(c, step), blobs));
        }
    }

    SECTION("Animates with time") {
        auto later = mesh::generate_metaballs(50.0, 1.7);
        bool differs = later.size() != faces.size();
        for (size_t i = 0; !differs && i < faces.size(); i++) {
            differs = later[i].vertices[0] != faces[i].vertices[0];
        }
        REQUIRE(differs);
    }

    SECTION("Invalid grid size falls back to the default") {
        auto fallback = mesh::generate_metaballs(50.0, 0.0, 0);
        REQUIRE(fallback.size() == faces.size());
    }
}

TEST_CASE("Volumetric - Fluid blob", "[mesh][fluid]") {
    auto particles = mesh::fluid_particles(50.0, 0.0);
    REQUIRE(particles.size() == static_cast<size_t>(mesh::FLUID_PARTICLE_COUNT));

    SECTION("Spherical puffs with bounded radii") {
        for (double t : {0.0, 0.9, 3.3}) {
            for (const auto& p : mesh::fluid_particles(50.0, t)) {
                REQUIRE(p.radii.x == p.radii.y);
                REQUIRE(p.radii.y == p.radii.z);
                REQUIRE(p.radii.x >= 50.0 * 0.16 - 1e-9);
                REQUIRE(p.radii.x <= 50.0 * 0.28 + 1e-9);
            }
        }
    }

    SECTION("One 8-segment sphere per particle") {
        auto faces = mesh::generate_fluid_blob(50.0, 0.0);
        REQUIRE(faces.size() == static_cast<size_t>(6 * 8 * 8));
    }

    SECTION("Each face is anchored at its particle centre") {
        auto faces = mesh::generate_fluid_blob(50.0, 0.4);
        auto moved = mesh::fluid_particles(50.0, 0.4);
        for (size_t i = 0; i < faces.size(); i++) {
            const Vec3& expected = moved[i / 64].center;
            REQUIRE(faces[i].anchor == expected);
        }
    }
}

TEST_CASE("Volumetric - Cloud volume", "[mesh][cloud]") {
    auto puffs = mesh::cloud_puffs(50.0, 2.0);
    REQUIRE(puffs.size() == static_cast<size_t>(mesh::CLOUD_PUFF_COUNT));

    SECTION("Puffs are flattened vertically") {
        for (const auto& puff : puffs) {
            REQUIRE(puff.radii.y == Approx(0.6 * puff.radii.x));
            REQUIRE(puff.radii.x == puff.radii.z);
        }
    }

    SECTION("One 8-segment ellipsoid per puff") {
        REQUIRE(mesh::generate_cloud_volume(50.0, 2.0).size() == static_cast<size_t>(7 * 64));
    }

    SECTION("Motion is continuous in time") {
        auto a = mesh::cloud_puffs(50.0, 2.0);
        auto b = mesh::cloud_puffs(50.0, 2.001);
        for (size_t i = 0; i < a.size(); i++) {
            REQUIRE(math::length(math::subtract(a[i].center, b[i].center)) < 0.1);
        }
    }
}
