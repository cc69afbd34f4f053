#pragma once

#include <frameline/core/math.hpp>
#include <optional>
#include <string>
#include <cstdint>

namespace frameline::render {

using namespace frameline::core;

enum class ColorSpace : uint8_t {
    SRGB,
    DisplayP3
};

const char* to_string(ColorSpace space);
std::optional<ColorSpace> parse_color_space(const std::string& name);

// Straight (non-premultiplied) RGBA color, components in [0, 1]
struct Color {
    Vec4 rgba{0.0f, 0.0f, 0.0f, 1.0f};

    Color() = default;
    Color(float r, float g, float b, float a = 1.0f) : rgba(r, g, b, a) {}
    explicit Color(const Vec4& value) : rgba(value) {}

    // Premultiplied form used by surfaces
    Vec4 premultiplied() const {
        return Vec4(rgba.r * rgba.a, rgba.g * rgba.a, rgba.b * rgba.a, rgba.a);
    }

    // "rgba(r, g, b, a)" with 0-255 channels and alpha in [0, 1]
    std::string serialize() const;

    // Accepts #rgb, #rrggbb, #rrggbbaa, rgb(r, g, b) and rgba(r, g, b, a)
    static std::optional<Color> parse(const std::string& text);

    static Color from_rgba8(uint8_t r, uint8_t g, uint8_t b, uint8_t a = 255);
    static Color transparent() { return Color(0.0f, 0.0f, 0.0f, 0.0f); }

    bool operator==(const Color& other) const { return rgba == other.rgba; }
    bool operator!=(const Color& other) const { return !(*this == other); }
};

} // namespace frameline::render
