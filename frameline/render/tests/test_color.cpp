#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <frameline/render/color.hpp>
#include <string>

using namespace frameline::render;
using Catch::Matchers::WithinAbs;

TEST_CASE("Color parsing", "[render][color]") {
    SECTION("Short hex") {
        auto color = Color::parse("#f00");
        REQUIRE(color.has_value());
        REQUIRE(*color == Color(1.0f, 0.0f, 0.0f, 1.0f));
    }

    SECTION("Long hex with alpha") {
        auto color = Color::parse("#00FF0080");
        REQUIRE(color.has_value());
        REQUIRE_THAT(color->rgba.g, WithinAbs(1.0, 1e-6));
        REQUIRE_THAT(color->rgba.a, WithinAbs(128.0 / 255.0, 1e-6));
    }

    SECTION("Functional notation") {
        auto rgb = Color::parse("rgb(0, 0, 255)");
        REQUIRE(rgb.has_value());
        REQUIRE(*rgb == Color(0.0f, 0.0f, 1.0f, 1.0f));

        auto rgba = Color::parse("  RGBA(255, 255, 255, 0.25) ");
        REQUIRE(rgba.has_value());
        REQUIRE_THAT(rgba->rgba.a, WithinAbs(0.25, 1e-6));
    }

    SECTION("Invalid strings") {
        REQUIRE_FALSE(Color::parse("").has_value());
        REQUIRE_FALSE(Color::parse("red").has_value());
        REQUIRE_FALSE(Color::parse("#12").has_value());
        REQUIRE_FALSE(Color::parse("#gg0000").has_value());
        REQUIRE_FALSE(Color::parse("rgb(1, 2)").has_value());
        REQUIRE_FALSE(Color::parse("hsl(0, 0, 0)").has_value());
        REQUIRE_FALSE(Color::parse("rgb(1, 2, x)").has_value());
    }
}

TEST_CASE("Color serialization", "[render][color]") {
    REQUIRE(Color(1.0f, 0.0f, 0.0f, 1.0f).serialize() == "rgba(255, 0, 0, 1)");
    REQUIRE(Color(0.0f, 0.0f, 1.0f, 0.5f).serialize() == "rgba(0, 0, 255, 0.5)");

    auto parsed = Color::parse(Color::from_rgba8(10, 20, 30, 255).serialize());
    REQUIRE(parsed.has_value());
    REQUIRE(nearly_equal(parsed->rgba, Color::from_rgba8(10, 20, 30, 255).rgba));
}

TEST_CASE("Color premultiplication", "[render][color]") {
    Vec4 p = Color(1.0f, 0.5f, 0.0f, 0.5f).premultiplied();
    REQUIRE(nearly_equal(p, Vec4(0.5f, 0.25f, 0.0f, 0.5f)));
}

TEST_CASE("Color space names", "[render][color]") {
    REQUIRE(parse_color_space("srgb") == ColorSpace::SRGB);
    REQUIRE(parse_color_space("Display-P3") == ColorSpace::DisplayP3);
    REQUIRE_FALSE(parse_color_space("rec2020").has_value());
    REQUIRE(std::string(to_string(ColorSpace::DisplayP3)) == "display-p3");
}
