#include "output/gutter.hpp"

#include <fmt/format.h>

using namespace yamlview;

namespace {

std::string
styled(const GutterContext& ctx, Category category, const std::string& text) {
    if (ctx.styles == nullptr) {
        return text;
    }
    return ctx.styles->style(category).render(text, ctx.profile);
}

std::string
number_column(int64_t line_number, const GutterContext& ctx) {
    if (ctx.annotation) {
        return fmt::format("{:4} ", "");
    }
    if (ctx.soft) {
        return "   - ";
    }
    return fmt::format("{:4} ", line_number);
}

std::string
marker_column(const GutterContext& ctx) {
    if (ctx.annotation || ctx.soft) {
        return "  ";
    }
    switch (ctx.flag) {
        case LineFlag::Inserted:
            return styled(ctx, Category::GenericInserted, "+") + " ";
        case LineFlag::Deleted:
            return styled(ctx, Category::GenericDeleted, "-") + " ";
        case LineFlag::Default:
            break;
    }
    return "  ";
}

}  // namespace

Gutter
gutters::none() {
    return [](int64_t, const GutterContext&) { return std::string(); };
}

Gutter
gutters::line_numbers() {
    return [](int64_t line_number, const GutterContext& ctx) {
        return styled(ctx, Category::Comment, number_column(line_number, ctx));
    };
}

Gutter
gutters::diff_markers() {
    return [](int64_t, const GutterContext& ctx) { return marker_column(ctx); };
}

Gutter
gutters::standard() {
    return [](int64_t line_number, const GutterContext& ctx) {
        return styled(ctx, Category::Comment, number_column(line_number, ctx)) + marker_column(ctx);
    };
}

std::optional<Gutter>
gutters::from_name(const std::string& name) {
    if (name == "none") {
        return none();
    }
    if (name == "line-numbers") {
        return line_numbers();
    }
    if (name == "diff") {
        return diff_markers();
    }
    if (name == "default") {
        return standard();
    }
    return {};
}
