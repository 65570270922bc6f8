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

#include "lighting.h"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cctype>
#include <cmath>

namespace {

constexpr size_t HEX_COLOR_DIGITS = 6;

int hex_value(char c) {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    return std::tolower(static_cast<unsigned char>(c)) - 'a' + 10;
}

uint8_t scale_channel(uint8_t channel, double factor) {
    double scaled = std::floor(channel * factor + 0.5);
    return static_cast<uint8_t>(std::clamp(scaled, 0.0, 255.0));
}

} // anonymous namespace

namespace facet {

std::optional<Rgb> parse_hex_color(const std::string& color) {
    std::string hex = color;
    if (!hex.empty() && hex[0] == '#') {
        hex.erase(0, 1);
    }

    if (hex.size() != HEX_COLOR_DIGITS) {
        return std::nullopt;
    }
    for (char c : hex) {
        if (!std::isxdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
    }

    Rgb rgb;
    rgb.r = static_cast<uint8_t>(hex_value(hex[0]) * 16 + hex_value(hex[1]));
    rgb.g = static_cast<uint8_t>(hex_value(hex[2]) * 16 + hex_value(hex[3]));
    rgb.b = static_cast<uint8_t>(hex_value(hex[4]) * 16 + hex_value(hex[5]));
    return rgb;
}

std::string format_rgb(const Rgb& color) {
    return fmt::format("rgb({},{},{})", color.r, color.g, color.b);
}

double calculate_lighting(const Vec3& normal, const std::vector<Light>& lights,
                          const Vec3& camera_rotation) {
    double total = 0.0;
    const Vec3 inverse_rotation = math::multiply(camera_rotation, -1.0);

    for (const auto& light : lights) {
        switch (light.kind) {
        case LightKind::AMBIENT:
            total += light.intensity;
            break;
        case LightKind::DIRECTIONAL: {
            Vec3 dir = math::normalize(math::rotate_euler(light.direction, inverse_rotation));
            total += std::max(0.0, math::dot(normal, dir)) * light.intensity;
            break;
        }
        }
    }

    return math::clamp(total, 0.0, 1.0);
}

std::string apply_lighting_to_color(const std::string& color, double intensity) {
    std::optional<Rgb> base = parse_hex_color(color);
    if (!base) {
        return color;
    }

    double factor = MIN_BRIGHTNESS + (1.0 - MIN_BRIGHTNESS) * intensity;
    Rgb lit;
    lit.r = scale_channel(base->r, factor);
    lit.g = scale_channel(base->g, factor);
    lit.b = scale_channel(base->b, factor);
    return format_rgb(lit);
}

} // namespace facet
