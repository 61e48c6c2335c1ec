#include "output/diagnostic.hpp"

#include <doctest.h>

using namespace yamlview;

TEST_CASE("validate yaml") {
    SUBCASE("valid documents") {
        auto source = Source::from_string("a: 1\n---\nb: [1, 2]\n");
        REQUIRE_FALSE(validate_yaml(*source).has_value());
    }

    SUBCASE("unterminated flow sequence") {
        auto source = Source::from_string("a: [1, 2\n");
        auto diagnostic = validate_yaml(*source);
        REQUIRE(diagnostic.has_value());
        CHECK_FALSE(diagnostic->message.empty());
        CHECK(diagnostic->position.line >= 1);
        CHECK(diagnostic->position.column >= 1);
    }

    SUBCASE("empty source is valid") {
        auto source = Source::from_string("");
        REQUIRE_FALSE(validate_yaml(*source).has_value());
    }
}

TEST_CASE("render diagnostic") {
    PrinterOptions options;
    options.color_profile = ColorProfile::Ansi16;
    options.styles = Styles(Style{}, {{Category::GenericErrorInvalid, Style(Color::kNone, Color::kRed)}});
    Printer printer(options);

    SUBCASE("highlights to the end of an unclassified line") {
        auto source = Source::from_lines({"key: value"});
        auto out = render_diagnostic(printer, *source, {"boom", {1, 6}});
        REQUIRE(out == "1:6: boom\nkey: \033[41mvalue\033[0m\n     ^ boom");
    }

    SUBCASE("highlights the segment under the column") {
        auto source = Source::from_lines({"key: value # note"});
        source->classify();
        auto out = render_diagnostic(printer, *source, {"boom", {1, 7}});
        REQUIRE(out.find("\033[41mvalue\033[0m") != std::string::npos);
        REQUIRE(out.find("      ^ boom") != std::string::npos);
    }

    SUBCASE("context lines") {
        PrinterOptions plain;
        plain.color_profile = ColorProfile::None;
        Printer plain_printer(plain);

        auto source = Source::from_lines({"l1", "l2", "l3", "l4", "l5"});
        auto out = render_diagnostic(plain_printer, *source, {"unexpected", {3, 4}}, 1);
        REQUIRE(out == "3:4: unexpected\nl2\nl3\n   ^ unexpected\nl4");

        // The source itself is left untouched.
        REQUIRE(source->overlays().empty());
        REQUIRE(source->line_at(3).annotations.empty());
    }

    SUBCASE("line numbers are kept in the gutter") {
        PrinterOptions numbered;
        numbered.color_profile = ColorProfile::None;
        numbered.gutter = gutters::line_numbers();
        Printer numbered_printer(numbered);

        auto source = Source::from_lines({"a", "b", "c", "d", "e", "f"});
        auto out = render_diagnostic(numbered_printer, *source, {"here", {5, 1}}, 1);
        REQUIRE(out == "5:1: here\n   4 d\n   5 e\n     ^ here\n   6 f");
    }
}

TEST_CASE("yaml path") {
    SUBCASE("parse and format") {
        auto path = YamlPath::parse("$.spec.ports[1].name");
        REQUIRE(path.has_value());
        REQUIRE(path->elements().size() == 4);
        REQUIRE(path->to_string() == "$.spec.ports[1].name");

        REQUIRE(YamlPath::parse("spec.ports")->to_string() == "$.spec.ports");
        REQUIRE(YamlPath::parse("$")->elements().empty());
        REQUIRE(YamlPath::root().child("a").index(0).to_string() == "$.a[0]");
    }

    SUBCASE("malformed paths") {
        REQUIRE_FALSE(YamlPath::parse("$.a[").has_value());
        REQUIRE_FALSE(YamlPath::parse("$.a[x]").has_value());
        REQUIRE_FALSE(YamlPath::parse("$..a").has_value());
        REQUIRE_FALSE(YamlPath::parse("$.a[]").has_value());
    }
}

TEST_CASE("resolve yaml path") {
    auto source = Source::from_string("name: app\nspec:\n  ports:\n    - 80\n    - 443\n  flow: [a, b]\n");

    SUBCASE("keys and values") {
        REQUIRE(resolve_yaml_path(*source, YamlPath::root().child("name")) == Position{1, 7});
        REQUIRE(resolve_yaml_path(*source, YamlPath::root().child("name"), PathPart::Key) == Position{1, 1});
        REQUIRE(resolve_yaml_path(*source, *YamlPath::parse("$.spec.ports"), PathPart::Key) == Position{3, 3});
    }

    SUBCASE("sequence entries") {
        REQUIRE(resolve_yaml_path(*source, *YamlPath::parse("$.spec.ports[1]")) == Position{5, 7});
        REQUIRE(resolve_yaml_path(*source, *YamlPath::parse("$.spec.flow[1]")) == Position{6, 13});

        // Sequence entries have no key; the value is used.
        REQUIRE(resolve_yaml_path(*source, *YamlPath::parse("$.spec.ports[0]"), PathPart::Key) == Position{4, 7});
    }

    SUBCASE("missing nodes") {
        REQUIRE_FALSE(resolve_yaml_path(*source, *YamlPath::parse("$.spec.volumes")).has_value());
        REQUIRE_FALSE(resolve_yaml_path(*source, *YamlPath::parse("$.spec.ports[2]")).has_value());
        REQUIRE_FALSE(resolve_yaml_path(*source, *YamlPath::parse("$.name.first")).has_value());
        REQUIRE_FALSE(resolve_yaml_path(*Source::from_string("a: [1\n"), *YamlPath::parse("$.a")).has_value());
    }

    SUBCASE("diagnostic at path") {
        auto diagnostic = diagnostic_at_path(*source, *YamlPath::parse("$.spec.ports[1]"), "port not allowed");
        REQUIRE(diagnostic.has_value());
        REQUIRE(diagnostic->message == "port not allowed");
        REQUIRE(diagnostic->position == Position{5, 7});
        REQUIRE_FALSE(diagnostic_at_path(*source, *YamlPath::parse("$.nope"), "x").has_value());
    }

    SUBCASE("columns count characters") {
        auto unicode = Source::from_string("ключ: значение\n");
        REQUIRE(resolve_yaml_path(*unicode, YamlPath::root().child("ключ")) == Position{1, 7});
    }
}

TEST_CASE("render diagnostics") {
    PrinterOptions plain;
    plain.color_profile = ColorProfile::None;
    Printer printer(plain);

    auto source = Source::from_lines({"l1", "l2", "l3", "l4", "l5", "l6", "l7", "l8", "l9"});

    SUBCASE("nearby windows merge") {
        auto out = render_diagnostics(printer,
                                      *source,
                                      {{"third", {8, 1}}, {"first", {2, 1}}, {"second", {3, 2}}},
                                      1);
        REQUIRE(out ==
                "2:1: first\n3:2: second\n8:1: third\n"
                "l1\nl2\n^ first\nl3\n ^ second\nl4\n"
                "\n"
                "l7\nl8\n^ third\nl9");
    }

    SUBCASE("two diagnostics on one line") {
        auto out = render_diagnostics(printer, *source, {{"a", {5, 1}}, {"b", {5, 2}}}, 0);
        REQUIRE(out == "5:1: a\n5:2: b\nl5\n^ a\n ^ b");
    }

    SUBCASE("paths into one snippet") {
        auto doc = Source::from_string("name: app\nreplicas: -1\nimage: \"\"\n");
        doc->classify();

        std::vector<Diagnostic> diagnostics;
        diagnostics.push_back(*diagnostic_at_path(*doc, *YamlPath::parse("$.replicas"), "must be positive"));
        diagnostics.push_back(*diagnostic_at_path(*doc, *YamlPath::parse("$.image"), "must not be empty"));

        auto out = render_diagnostics(printer, *doc, diagnostics, 0);
        REQUIRE(out ==
                "2:11: must be positive\n3:8: must not be empty\n"
                "replicas: -1\n          ^ must be positive\nimage: \"\"\n       ^ must not be empty");
    }

    SUBCASE("no diagnostics") {
        REQUIRE(render_diagnostics(printer, *source, {}).empty());
    }
}
