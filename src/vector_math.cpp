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

#include "vector_math.h"

#include <algorithm>
#include <cmath>
#include <glm/common.hpp>
#include <glm/geometric.hpp>
#include <glm/gtx/rotate_vector.hpp>

namespace facet {
namespace math {

Vec3 add(const Vec3& a, const Vec3& b) {
    return a + b;
}

Vec3 subtract(const Vec3& a, const Vec3& b) {
    return a - b;
}

Vec3 multiply(const Vec3& v, double s) {
    return v * s;
}

Vec3 divide(const Vec3& v, double s) {
    return v / s;
}

Vec3 multiply_components(const Vec3& a, const Vec3& b) {
    return a * b;
}

double dot(const Vec3& a, const Vec3& b) {
    return glm::dot(a, b);
}

Vec3 cross(const Vec3& a, const Vec3& b) {
    return glm::cross(a, b);
}

double length(const Vec3& v) {
    return glm::length(v);
}

Vec3 normalize(const Vec3& v) {
    // glm::normalize() yields NaN for the zero vector
    double len = glm::length(v);
    if (len == 0.0) {
        return Vec3(0.0, 0.0, 0.0);
    }
    return v / len;
}

Vec3 rotate_x(const Vec3& v, double angle) {
    return glm::rotateX(v, angle);
}

Vec3 rotate_y(const Vec3& v, double angle) {
    return glm::rotateY(v, angle);
}

Vec3 rotate_z(const Vec3& v, double angle) {
    return glm::rotateZ(v, angle);
}

Vec3 rotate_euler(const Vec3& v, const Vec3& rotation) {
    Vec3 result = rotate_x(v, rotation.x);
    result = rotate_y(result, rotation.y);
    result = rotate_z(result, rotation.z);
    return result;
}

double lerp(double a, double b, double t) {
    return glm::mix(a, b, t);
}

Vec3 lerp(const Vec3& a, const Vec3& b, double t) {
    return glm::mix(a, b, t);
}

double clamp(double value, double min_value, double max_value) {
    return std::max(min_value, std::min(max_value, value));
}

double snap_to_grid(double value, double grid_size) {
    if (grid_size <= 0.0) {
        return value;
    }
    return std::floor(value / grid_size + 0.5) * grid_size;
}

Vec3 snap_to_grid(const Vec3& v, double grid_size) {
    return Vec3(snap_to_grid(v.x, grid_size), snap_to_grid(v.y, grid_size),
                snap_to_grid(v.z, grid_size));
}

Vec3 constrain_to_axis(const Vec3& delta, AxisConstraint axis) {
    switch (axis) {
    case AxisConstraint::X:
        return Vec3(delta.x, 0.0, 0.0);
    case AxisConstraint::Y:
        return Vec3(0.0, delta.y, 0.0);
    case AxisConstraint::Z:
        return Vec3(0.0, 0.0, delta.z);
    case AxisConstraint::XY:
        return Vec3(delta.x, delta.y, 0.0);
    case AxisConstraint::XZ:
        return Vec3(delta.x, 0.0, delta.z);
    case AxisConstraint::YZ:
        return Vec3(0.0, delta.y, delta.z);
    case AxisConstraint::NONE:
    default:
        return delta;
    }
}

AxisConstraint parse_axis_constraint(const std::string& name) {
    if (name == "x")
        return AxisConstraint::X;
    if (name == "y")
        return AxisConstraint::Y;
    if (name == "z")
        return AxisConstraint::Z;
    if (name == "xy")
        return AxisConstraint::XY;
    if (name == "xz")
        return AxisConstraint::XZ;
    if (name == "yz")
        return AxisConstraint::YZ;
    return AxisConstraint::NONE;
}

const char* axis_constraint_name(AxisConstraint axis) {
    switch (axis) {
    case AxisConstraint::X:
        return "x";
    case AxisConstraint::Y:
        return "y";
    case AxisConstraint::Z:
        return "z";
    case AxisConstraint::XY:
        return "xy";
    case AxisConstraint::XZ:
        return "xz";
    case AxisConstraint::YZ:
        return "yz";
    case AxisConstraint::NONE:
    default:
        return "none";
    }
}

double ease_in_out(double t) {
    return t < 0.5 ? 2.0 * t * t : 1.0 - std::pow(-2.0 * t + 2.0, 2) / 2.0;
}

double ease_in_cubic(double t) {
    return t * t * t;
}

double ease_out_cubic(double t) {
    return 1.0 - std::pow(1.0 - t, 3);
}

} // namespace math
} // namespace facet
