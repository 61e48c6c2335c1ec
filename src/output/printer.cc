#include "output/printer.hpp"

#include "util/tty.hpp"
#include "util/utf8decode.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <utility>

//#define LOCAL_DEBUG

using namespace yamlview;

namespace {

struct Cell {
    // Code point from the source line.
    char32_t codepoint;

    // What is emitted for it.
    std::string text;
    int64_t width;

    StylePtr style;
};

using Row = std::pair<std::size_t, std::size_t>;

char32_t
control_picture(char32_t c) {
    if (c < 0x20) {
        return 0x2400 + c;
    }
    if (c == 0x7F) {
        return 0x2421;
    }
    if (c >= 0x80 && c <= 0x9F) {
        return kReplacementCharacter;
    }
    return c;
}

bool
is_break_after(char32_t c) {
    return c == ' ' || c == '/' || c == '-';
}

// Split cells into rows of at most `width` cells, breaking after a space,
// slash or dash when one is available.
std::vector<Row>
wrap_rows(const std::vector<Cell>& cells, int64_t width) {
    if (width <= 0 || cells.empty()) {
        return {{0, cells.size()}};
    }

    std::vector<Row> rows;
    std::size_t start = 0;
    while (start < cells.size()) {
        int64_t used = 0;
        std::size_t end = start;
        while (end < cells.size() && (end == start || used + cells[end].width <= width)) {
            used += cells[end].width;
            end++;
        }

        if (end < cells.size()) {
            for (std::size_t i = end; i > start + 1; i--) {
                if (is_break_after(cells[i - 1].codepoint)) {
                    end = i;
                    break;
                }
            }
        }

        rows.emplace_back(start, end);
        start = end;
    }
    return rows;
}

// Emit cells [begin, end) with one SGR run per distinct style object.
std::string
render_cells(const std::vector<Cell>& cells, const Row& row, ColorProfile profile) {
    std::string out;
    std::string run;
    const Style* current = nullptr;

    for (std::size_t i = row.first; i < row.second; i++) {
        const auto& cell = cells[i];
        if (cell.style.get() != current && !run.empty()) {
            out += current->render(run, profile);
            run.clear();
        }
        current = cell.style.get();
        run += cell.text;
    }

    if (!run.empty()) {
        out += current->render(run, profile);
    }
    return out;
}

int64_t
visible_width(const std::string& text) {
    return utf8_len(strip_sgr(text));
}

}  // namespace

Printer::Printer(PrinterOptions options)
    : options_(std::move(options))
    , composer_(std::make_shared<Composer>()) {}

int64_t
Printer::row_width() const {
    if (options_.width >= 0) {
        return options_.width;
    }
    int rows = 0;
    int cols = 0;
    tty_get_term_size(&rows, &cols);
    return cols;
}

void
Printer::render_line(const Source& source, int64_t n, bool first_rendered, std::vector<std::string>& rows) const {
    const Line& line = source.line_at(n);
    const Styles& styles = options_.styles;
    const ColorProfile profile = options_.color_profile;

    GutterContext ctx;
    ctx.styles = &styles;
    ctx.profile = profile;
    ctx.index = n;
    ctx.number = line.number;
    ctx.total_lines = source.line_count();
    ctx.flag = line.flag;

    auto gutter = [&](bool annotation, bool soft) {
        if (!options_.gutter || !*options_.gutter) {
            return std::string();
        }
        GutterContext row_ctx = ctx;
        row_ctx.annotation = annotation;
        row_ctx.soft = soft;
        return (*options_.gutter)(line.number, row_ctx);
    };

    if (line.hunk_start && !first_rendered && options_.hunk_separator) {
        rows.push_back(styles.style(Category::TextSubtle).render(*options_.hunk_separator, profile));
    }

    const Style& annotation_style = styles.style(Category::Comment);
    if (options_.annotations) {
        for (const auto& annotation : line.annotations) {
            if (annotation.placement == Annotation::Placement::Above) {
                rows.push_back(gutter(true, false) + annotation_style.render(annotation.content, profile));
            }
        }
    }

    // Base classification
    std::vector<Cell> cells;
    const StylePtr& text_style = styles.style_ptr(Category::Text);
    int64_t cell_column = 0;
    std::string::size_type offset = 0;
    while (offset < line.text.size()) {
        const char32_t cp = utf8_next(line.text, &offset);
        Cell cell{cp, {}, 1, text_style};
        if (options_.control_escape) {
            utf8_append(cell.text, control_picture(cp));
        } else if (cp == '\t' && options_.tab_width > 0) {
            cell.width = options_.tab_width - (cell_column % options_.tab_width);
            cell.text.assign(static_cast<std::size_t>(cell.width), ' ');
        } else {
            utf8_append(cell.text, cp);
        }
        cell_column += cell.width;
        cells.push_back(std::move(cell));
    }

    for (const auto& segment : line.segments) {
        auto from = static_cast<std::size_t>(segment.span.start().column - 1);
        auto to = std::min(static_cast<std::size_t>(segment.span.end().column - 1), cells.size());
        const StylePtr& style = styles.style_ptr(segment.category);
        for (auto i = from; i < to; i++) {
            cells[i].style = style;
        }
    }

    // Overlays fold in insertion order
    std::vector<bool> overridden(cells.size(), false);
    for (const auto& overlay : source.overlays()) {
        const Span clip = overlay.span.clip_to_line(n);
        if (clip.is_empty()) {
            continue;
        }

        auto from = static_cast<std::size_t>(clip.start().column - 1);
        auto to = clip.end().column == kLineEnd
                      ? cells.size()
                      : std::min(static_cast<std::size_t>(clip.end().column - 1), cells.size());
        const StylePtr& overlay_style = styles.style_ptr(overlay.category);

        const Style* last_input = nullptr;
        bool last_override = false;
        StylePtr last_output;
        for (auto i = from; i < to; i++) {
            const bool override_colors = options_.overlay_mode == OverlayMode::OverrideFirst && !overridden[i];
            overridden[i] = true;

            if (last_output && cells[i].style.get() == last_input && last_override == override_colors) {
                cells[i].style = last_output;
                continue;
            }
            last_input = cells[i].style.get();
            last_override = override_colors;
            last_output = composer_->blend(cells[i].style, overlay_style, override_colors, styles.id());
            cells[i].style = last_output;
        }
    }

    const int64_t width = row_width();
    int64_t content_width = 0;
    if (width > 0) {
        content_width = std::max<int64_t>(1, width - visible_width(gutter(false, false)));
    }

    const auto content_rows = wrap_rows(cells, content_width);
    for (std::size_t r = 0; r < content_rows.size(); r++) {
        rows.push_back(gutter(false, r > 0) + render_cells(cells, content_rows[r], profile));
    }

    if (options_.annotations) {
        for (const auto& annotation : line.annotations) {
            if (annotation.placement == Annotation::Placement::Below) {
                auto indent = static_cast<std::size_t>(std::max<int64_t>(annotation.column - 1, 0));
                auto text = std::string(indent, ' ') + "^ " + annotation.content;
                rows.push_back(gutter(true, false) + annotation_style.render(text, profile));
            }
        }
    }

#ifdef LOCAL_DEBUG
    fmt::print("line {}: {} cells, {} rows\n", n, cells.size(), content_rows.size());
#endif
}

void
Printer::render_range(const Source& source, int64_t first, int64_t last, std::vector<std::string>& rows) const {
    first = std::max<int64_t>(first, 1);
    last = std::min(last, source.line_count());
    for (int64_t n = first; n <= last; n++) {
        render_line(source, n, n == first, rows);
    }
}

std::string
Printer::print(const Source& source) const {
    std::vector<std::string> rows;
    render_range(source, 1, source.line_count(), rows);

    auto out = fmt::format("{}", fmt::join(rows, "\n"));
    if (source.has_trailing_newline() && !source.empty()) {
        out += "\n";
    }
    return out;
}

std::string
Printer::print_slice(const Source& source, int64_t first, int64_t last) const {
    std::vector<std::string> rows;
    render_range(source, first, last, rows);
    return fmt::format("{}", fmt::join(rows, "\n"));
}

std::string
Printer::print_spans(const Source& source, const std::vector<Span>& spans) const {
    std::vector<std::string> blocks;
    for (const auto& span : union_adjacent_or_overlapping(spans)) {
        std::vector<std::string> rows;
        render_range(source, span.first_line(), span.last_line(), rows);
        if (!rows.empty()) {
            blocks.push_back(fmt::format("{}", fmt::join(rows, "\n")));
        }
    }
    return fmt::format("{}", fmt::join(blocks, "\n\n"));
}
