#include "config/config.hpp"

#include <doctest.h>

#include <filesystem>
#include <fstream>

using namespace yamlview;

namespace {

std::filesystem::path
scratch_directory(const std::string& name) {
    auto dir = std::filesystem::temp_directory_path() / "yamlview_config_tests" / name;
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    return dir;
}

void
write_file(const std::filesystem::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary);
    out << content;
}

}  // namespace

TEST_CASE("config options") {
    const auto dir = scratch_directory("options");

    SUBCASE("config directory") {
        const auto path = config_get_directory();
        REQUIRE(path.size() > 9);
        REQUIRE(path.substr(path.size() - 9) == "/yamlview");
        REQUIRE(config_get_themes_directory() == path + "/themes");
    }

    SUBCASE("missing file") {
        Options options;
        std::string error;
        REQUIRE(config_load_options((dir / "nope.yaml").string(), options, error) == ConfigLoadResult::DoesNotExist);
        REQUIRE(options.theme == kDefaultTheme);
    }

    SUBCASE("partial file keeps defaults") {
        const auto path = dir / "partial.yaml";
        write_file(path,
                   "printer:\n"
                   "  theme: github\n"
                   "  width: -1\n"
                   "diff:\n"
                   "  algorithm: myers-linear\n"
                   "finder:\n"
                   "  case_fold: false\n"
                   "  transformers: [Latin-ASCII]\n");

        Options options;
        std::string error;
        REQUIRE(config_load_options(path.string(), options, error) == ConfigLoadResult::Ok);
        REQUIRE(options.theme == "github");
        REQUIRE(options.width == -1);
        REQUIRE(options.tab_width == 8);
        REQUIRE(options.context_lines == 3);
        REQUIRE(options.algorithm == "myers-linear");
        REQUIRE_FALSE(options.case_fold);
        REQUIRE(options.diacritic_fold);
        REQUIRE(options.transformers == std::vector<std::string>{"Latin-ASCII"});
    }

    SUBCASE("values of the wrong type are skipped") {
        const auto path = dir / "typed.yaml";
        write_file(path, "printer:\n  tab_width: wide\n  annotations: false\n");

        Options options;
        std::string error;
        REQUIRE(config_load_options(path.string(), options, error) == ConfigLoadResult::Ok);
        REQUIRE(options.tab_width == 8);
        REQUIRE_FALSE(options.annotations);
    }

    SUBCASE("invalid files") {
        const auto broken = dir / "broken.yaml";
        write_file(broken, "printer: [1, 2\n");
        const auto scalar = dir / "scalar.yaml";
        write_file(scalar, "just text\n");

        Options options;
        std::string error;
        REQUIRE(config_load_options(broken.string(), options, error) == ConfigLoadResult::Invalid);
        REQUIRE_FALSE(error.empty());
        REQUIRE(config_load_options(scalar.string(), options, error) == ConfigLoadResult::Invalid);
    }

    SUBCASE("write defaults and read them back") {
        const auto path = dir / "nested" / "yamlview.yaml";

        Options written;
        written.theme = "monokai";
        written.context_lines = 5;
        written.gutter = "line-numbers";
        written.transformers = {"Any-Latin", "Latin-ASCII"};
        REQUIRE(config_write_defaults(path.string(), written));

        Options read;
        std::string error;
        REQUIRE(config_load_options(path.string(), read, error) == ConfigLoadResult::Ok);
        REQUIRE(read.theme == "monokai");
        REQUIRE(read.context_lines == 5);
        REQUIRE(read.gutter == "line-numbers");
        REQUIRE(read.transformers == written.transformers);
        REQUIRE(read.color_profile == "auto");
    }
}

TEST_CASE("config conversions") {
    SUBCASE("printer options") {
        Options options;
        options.theme = "bw";
        options.gutter = "diff";
        options.overlay_mode = "override-first";
        options.color_profile = "16";
        options.width = 40;

        auto printer = config_printer_options(options);
        REQUIRE(printer.gutter.has_value());
        REQUIRE(printer.overlay_mode == OverlayMode::OverrideFirst);
        REQUIRE(printer.color_profile == ColorProfile::Ansi16);
        REQUIRE(printer.width == 40);
        REQUIRE(printer.styles.style(Category::NameTag).fg == theme_styles("bw")->style(Category::NameTag).fg);
        REQUIRE(printer.styles.style(Category::NameTag).attr == theme_styles("bw")->style(Category::NameTag).attr);
    }

    SUBCASE("unknown names fall back") {
        Options options;
        options.theme = "no-such-theme";
        options.gutter = "sideways";
        options.color_profile = "infrared";

        auto printer = config_printer_options(options);
        REQUIRE_FALSE(printer.gutter.has_value());
        REQUIRE(printer.color_profile == ColorProfile::TrueColor);
    }

    SUBCASE("named values") {
        REQUIRE(color_profile_from_name("256") == ColorProfile::Ansi256);
        REQUIRE(color_profile_from_name("none") == ColorProfile::None);
        REQUIRE(color_profile_from_name("auto").has_value());
        REQUIRE_FALSE(color_profile_from_name("").has_value());
        REQUIRE(overlay_mode_from_name("blend") == OverlayMode::Blend);
        REQUIRE_FALSE(overlay_mode_from_name("mix").has_value());
    }

    SUBCASE("diff and normalizer options") {
        Options options;
        options.algorithm = "myers-linear";
        options.hunk_headers = true;
        options.width_fold = true;

        auto diff = config_diff_options(options);
        REQUIRE(diff.algorithm == DiffAlgorithm::MyersLinear);
        REQUIRE(diff.hunk_headers);

        auto normalizer = config_normalizer_options(options);
        REQUIRE(normalizer.case_fold);
        REQUIRE(normalizer.width_fold);
    }
}

TEST_CASE("config themes") {
    const auto dir = scratch_directory("themes");

    SUBCASE("load theme file") {
        const auto path = dir / "ocean.yaml";
        write_file(path,
                   "name: ocean-test\n"
                   "mode: light\n"
                   "base: \"#102030 bg:#ffffff\"\n"
                   "styles:\n"
                   "  name-tag: \"bold #0000ff\"\n"
                   "  not-a-category: red\n"
                   "  comment: \"not-a-color\"\n");

        std::string name;
        std::string error;
        REQUIRE(config_load_theme(path.string(), name, error) == ConfigLoadResult::Ok);
        REQUIRE(name == "ocean-test");
        REQUIRE(theme_mode("ocean-test") == Mode::Light);

        auto styles = theme_styles("ocean-test");
        REQUIRE(styles.has_value());
        REQUIRE(styles->style(Category::NameTag).has(Style::Attribute::Bold));
        REQUIRE(styles->style(Category::NameTag).fg == *Color::parse("#0000ff"));
        REQUIRE(styles->style(Category::Comment).fg == *Color::parse("#102030"));
    }

    SUBCASE("name defaults to the file name") {
        const auto path = dir / "plain-test.yaml";
        write_file(path, "mode: dark\n");

        std::string name;
        std::string error;
        REQUIRE(config_load_theme(path.string(), name, error) == ConfigLoadResult::Ok);
        REQUIRE(name == "plain-test");
        REQUIRE(theme_mode("plain-test") == Mode::Dark);
    }

    SUBCASE("invalid mode") {
        const auto path = dir / "dim.yaml";
        write_file(path, "mode: twilight\n");

        std::string name;
        std::string error;
        REQUIRE(config_load_theme(path.string(), name, error) == ConfigLoadResult::Invalid);
        REQUIRE(error.find("twilight") != std::string::npos);
    }

    SUBCASE("load a directory") {
        write_file(dir / "b.yaml", "name: dir-test-b\n");
        write_file(dir / "a.yml", "name: dir-test-a\n");
        write_file(dir / "broken.yaml", "name: [\n");
        write_file(dir / "notes.txt", "name: ignored\n");

        auto names = config_load_user_themes(dir.string());
        REQUIRE(names == std::vector<std::string>{"dir-test-a", "dir-test-b"});
        REQUIRE(config_load_user_themes((dir / "missing").string()).empty());
    }
}

TEST_CASE("config user theme from the config directory") {
    const auto dir = scratch_directory("user-theme");
    std::filesystem::create_directories(dir / "themes");
    write_file(dir / "yamlview.yaml", "printer:\n  theme: harbor-test\n");
    write_file(dir / "themes" / "harbor.yaml",
               "name: harbor-test\n"
               "mode: dark\n"
               "styles:\n"
               "  name-tag: \"italic #ff8800\"\n");

    Options options;
    config_apply_options(options, dir.string());
    REQUIRE(options.theme == "harbor-test");

    auto printer = config_printer_options(options);
    REQUIRE(printer.styles.style(Category::NameTag).fg == *Color::parse("#ff8800"));
    REQUIRE(printer.styles.style(Category::NameTag).has(Style::Attribute::Italic));
    REQUIRE(printer.styles.style(Category::NameTag).fg != theme_styles(kDefaultTheme)->style(Category::NameTag).fg);
}
