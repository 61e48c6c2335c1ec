#include "style/style.hpp"

#include <doctest.h>

using namespace yamlview;

TEST_CASE("style") {
    SUBCASE("sgr") {
        Style s(Color::rgb(255, 0, 0), Color::rgb(0, 0, 0), Style::Attribute::Bold);
        REQUIRE(s.sgr(ColorProfile::TrueColor) == "\033[38;2;255;0;0;1;48;2;0;0;0m");
        REQUIRE(s.sgr(ColorProfile::None).empty());
        REQUIRE(Style{}.sgr(ColorProfile::TrueColor).empty());
    }

    SUBCASE("render") {
        Style s(Color::kRed);
        REQUIRE(s.render("abc", ColorProfile::TrueColor) == "\033[31mabc\033[0m");
        REQUIRE(s.render("", ColorProfile::TrueColor).empty());
        REQUIRE(Style{}.render("abc", ColorProfile::TrueColor) == "abc");

        auto upper = s.with_transform([](const std::string& text) { return "<" + text + ">"; });
        REQUIRE(upper.render("x", ColorProfile::None) == "<x>");
    }

    SUBCASE("empty") {
        REQUIRE(Style{}.empty());
        REQUIRE(Style(Color::kTransparent).empty());
        REQUIRE_FALSE(Style{}.with(Style::Attribute::Italic).empty());
        REQUIRE_FALSE(Style{}.with_transform([](const std::string& t) { return t; }).empty());
    }

    SUBCASE("parse") {
        auto s = parse_style("bold italic #ff0000 bg:#00ff00");
        REQUIRE(s.has_value());
        REQUIRE(s->has(Style::Attribute::Bold));
        REQUIRE(s->has(Style::Attribute::Italic));
        REQUIRE(s->fg == Color::rgb(255, 0, 0));
        REQUIRE(s->bg == Color::rgb(0, 255, 0));

        auto toggled = parse_style("bold nobold underline");
        REQUIRE(toggled.has_value());
        REQUIRE_FALSE(toggled->has(Style::Attribute::Bold));
        REQUIRE(toggled->has(Style::Attribute::Underline));

        REQUIRE(parse_style("noinherit border:#fff red")->fg == Color::kRed);
        REQUIRE(parse_style("")->empty());
        REQUIRE_FALSE(parse_style("shiny").has_value());
        REQUIRE_FALSE(parse_style("bg:#12").has_value());
    }

    SUBCASE("encode") {
        Style s(Color::rgb(0x12, 0x34, 0x56), Color::rgb(0xab, 0xcd, 0xef), Style::Attribute::Bold);
        REQUIRE(encode_style(s) == "bold #123456 bg:#abcdef");
        REQUIRE(encode_style(Style{}).empty());

        auto parsed = parse_style(encode_style(s));
        REQUIRE(parsed.has_value());
        REQUIRE(parsed->fg == s.fg);
        REQUIRE(parsed->bg == s.bg);
        REQUIRE(parsed->attr == s.attr);
    }

    SUBCASE("encode keeps palette colors") {
        Style s(Color::kRed, Color::kLightBlue, Style::Attribute::Underline);
        REQUIRE(encode_style(s) == "underline red bg:light_blue");

        auto parsed = parse_style(encode_style(s));
        REQUIRE(parsed.has_value());
        REQUIRE(parsed->fg.kind == Color::Kind::Color4bit);
        REQUIRE(parsed->fg == Color::kRed);
        REQUIRE(parsed->bg.kind == Color::Kind::Color4bit);
        REQUIRE(parsed->bg == Color::kLightBlue);
    }

    SUBCASE("strip sgr") {
        Style s(Color::kRed, Color::kNone, Style::Attribute::Bold);
        REQUIRE(strip_sgr(s.render("abc", ColorProfile::TrueColor)) == "abc");
        REQUIRE(strip_sgr("plain") == "plain");
        REQUIRE(strip_sgr("a\033[1;31mb\033[0mc") == "abc");
    }
}
