#include "util/color.hpp"

#include <doctest.h>

#include <cstdlib>

using namespace yamlview;

TEST_CASE("color") {
    SUBCASE("hex") {
        auto c = Color::from_hex("#ff8000");
        REQUIRE(c.has_value());
        REQUIRE(c->kind == Color::Kind::Color24bit);
        REQUIRE(c->r == 255);
        REQUIRE(c->g == 128);
        REQUIRE(c->b == 0);
        REQUIRE(c->to_hex() == "#ff8000");

        auto short_form = Color::from_hex("#fff");
        REQUIRE(short_form.has_value());
        REQUIRE(*short_form == Color::rgb(255, 255, 255));

        REQUIRE_FALSE(Color::from_hex("fff").has_value());
        REQUIRE_FALSE(Color::from_hex("#ggg").has_value());
        REQUIRE_FALSE(Color::from_hex("#12345").has_value());
    }

    SUBCASE("parse") {
        REQUIRE(Color::parse("red") == Color::kRed);
        REQUIRE(Color::parse("light_blue") == Color::kLightBlue);
        REQUIRE(Color::parse("none") == Color::kNone);
        REQUIRE(Color::parse("transparent") == Color::kTransparent);
        REQUIRE_FALSE(Color::parse("").has_value());
        REQUIRE_FALSE(Color::parse("purple").has_value());
    }

    SUBCASE("visibility") {
        REQUIRE_FALSE(Color::kNone.is_visible());
        REQUIRE_FALSE(Color::kTransparent.is_visible());
        REQUIRE(Color::kRed.is_visible());
        REQUIRE(Color::rgb(1, 2, 3).is_visible());
    }

    SUBCASE("blend") {
        auto black = Color::rgb(0, 0, 0);
        auto white = Color::rgb(255, 255, 255);

        REQUIRE(blend_colors(black, Color::kNone) == black);
        REQUIRE(blend_colors(Color::kNone, white) == white);
        REQUIRE(blend_colors(Color::kNone, Color::kNone) == Color::kNone);
        REQUIRE(blend_colors(Color::kTransparent, white) == white);

        auto mid = blend_colors(black, white);
        REQUIRE(mid.kind == Color::Kind::Color24bit);
        CHECK(std::abs(mid.r - mid.g) <= 1);
        CHECK(std::abs(mid.g - mid.b) <= 1);
        // LAB midpoint is lighter than the sRGB midpoint
        CHECK(mid.r > 110);
        CHECK(mid.r < 130);

        REQUIRE(blend_lab(black, white, 0.0) == black);
        REQUIRE(blend_lab(black, white, 1.0) == white);
    }

    SUBCASE("override") {
        auto a = Color::rgb(10, 20, 30);
        auto b = Color::rgb(40, 50, 60);
        REQUIRE(override_color(a, b) == b);
        REQUIRE(override_color(a, Color::kNone) == a);
        REQUIRE(override_color(a, Color::kTransparent) == a);
    }

    SUBCASE("lighten and darken") {
        auto gray = Color::rgb(100, 100, 100);
        auto lighter = gray.lighten(0.2);
        auto darker = gray.darken(0.2);
        REQUIRE(lighter.r > gray.r);
        REQUIRE(darker.r < gray.r);
        REQUIRE(Color::rgb(255, 255, 255).lighten(0.5).r >= 254);
        REQUIRE(Color::kNone.lighten(0.5) == Color::kNone);
    }

    SUBCASE("sgr codes") {
        std::vector<int> codes;
        color_sgr_codes(Color::rgb(1, 2, 3), true, ColorProfile::TrueColor, codes);
        REQUIRE(codes == std::vector<int>{38, 2, 1, 2, 3});

        codes.clear();
        color_sgr_codes(Color::rgb(1, 2, 3), false, ColorProfile::TrueColor, codes);
        REQUIRE(codes == std::vector<int>{48, 2, 1, 2, 3});

        codes.clear();
        color_sgr_codes(Color::kRed, true, ColorProfile::TrueColor, codes);
        REQUIRE(codes == std::vector<int>{31});

        codes.clear();
        color_sgr_codes(Color::kLightCyan, false, ColorProfile::Ansi256, codes);
        REQUIRE(codes == std::vector<int>{106});

        codes.clear();
        color_sgr_codes(Color::rgb(255, 0, 0), true, ColorProfile::Ansi256, codes);
        REQUIRE(codes == std::vector<int>{38, 5, 196});

        codes.clear();
        color_sgr_codes(Color::rgb(250, 10, 10), true, ColorProfile::Ansi16, codes);
        REQUIRE(codes == std::vector<int>{91});

        codes.clear();
        color_sgr_codes(Color::rgb(1, 2, 3), true, ColorProfile::None, codes);
        color_sgr_codes(Color::kNone, true, ColorProfile::TrueColor, codes);
        REQUIRE(codes.empty());
    }

    SUBCASE("ansi256 gray ramp") {
        REQUIRE(color_to_ansi256(Color::rgb(128, 128, 128)) == 244);
        REQUIRE(color_to_ansi256(Color::rgb(0, 0, 0)) == 16);
    }
}
