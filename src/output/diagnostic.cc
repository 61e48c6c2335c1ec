#include "output/diagnostic.hpp"

#include "util/utf8decode.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <yaml-cpp/yaml.h>

#include <algorithm>

using namespace yamlview;

//#define LOCAL_DEBUG

namespace {

// yaml-cpp marks count bytes from zero.
Position
position_from_mark(const std::string& content, const YAML::Mark& mark) {
    if (mark.is_null() || mark.pos < 0) {
        return {std::max(mark.line, 0) + int64_t{1}, std::max(mark.column, 0) + int64_t{1}};
    }

    const auto offset = std::min(static_cast<std::size_t>(mark.pos), content.size());
    const auto line_start = content.rfind('\n', offset == 0 ? 0 : offset - 1);
    const std::size_t begin = (line_start == std::string::npos || offset == 0) ? 0 : line_start + 1;
    const auto line = std::count(content.begin(), content.begin() + static_cast<std::ptrdiff_t>(begin), '\n');

    return {static_cast<int64_t>(line) + 1, static_cast<int64_t>(utf8_len(content, begin, offset)) + 1};
}

Span
offending_span(const Source& source, const Position& at) {
    for (const auto& segment : source.segments(at.line)) {
        if (segment.span.contains(at)) {
            return segment.span;
        }
    }
    return Span(at, {at.line, kLineEnd});
}

}  // namespace

std::optional<Diagnostic>
yamlview::validate_yaml(const Source& source) {
    const auto content = source.content();
    try {
        YAML::LoadAll(content);
    } catch (const YAML::ParserException& e) {
#ifdef LOCAL_DEBUG
        fmt::print("diagnostic: {} at {}:{} (pos {})\n", e.msg, e.mark.line, e.mark.column, e.mark.pos);
#endif
        return Diagnostic{e.msg, position_from_mark(content, e.mark)};
    }
    return {};
}

std::optional<YamlPath>
YamlPath::parse(const std::string& text) {
    YamlPath path;
    std::size_t i = 0;
    if (!text.empty() && text[0] == '$') {
        i = 1;
    }

    while (i < text.size()) {
        if (text[i] == '.') {
            const auto end = text.find_first_of(".[", i + 1);
            const auto key = text.substr(i + 1, end == std::string::npos ? std::string::npos : end - i - 1);
            if (key.empty()) {
                return {};
            }
            path.child(key);
            i = end == std::string::npos ? text.size() : end;
        } else if (text[i] == '[') {
            const auto end = text.find(']', i + 1);
            if (end == std::string::npos || end == i + 1) {
                return {};
            }
            const auto digits = text.substr(i + 1, end - i - 1);
            if (digits.find_first_not_of("0123456789") != std::string::npos) {
                return {};
            }
            path.index(static_cast<std::size_t>(std::stoull(digits)));
            i = end + 1;
        } else if (i == 0) {
            // A bare first key, as in "spec.ports".
            const auto end = text.find_first_of(".[");
            path.child(text.substr(0, end));
            i = end == std::string::npos ? text.size() : end;
        } else {
            return {};
        }
    }
    return path;
}

std::string
YamlPath::to_string() const {
    std::string result = "$";
    for (const auto& element : elements_) {
        if (const auto* key = std::get_if<std::string>(&element)) {
            result += fmt::format(".{}", *key);
        } else {
            result += fmt::format("[{}]", std::get<std::size_t>(element));
        }
    }
    return result;
}

std::optional<Position>
yamlview::resolve_yaml_path(const Source& source, const YamlPath& path, PathPart part) {
    const auto content = source.content();

    YAML::Node current;
    try {
        current = YAML::Load(content);
    } catch (const YAML::Exception& e) {
#ifdef LOCAL_DEBUG
        fmt::print("resolve_yaml_path: {}\n", e.what());
#endif
        return {};
    }

    YAML::Mark key_mark = YAML::Mark::null_mark();
    for (const auto& element : path.elements()) {
        YAML::Node next;
        bool found = false;

        if (const auto* key = std::get_if<std::string>(&element)) {
            if (!current.IsMap()) {
                return {};
            }
            for (const auto& entry : current) {
                if (entry.first.IsScalar() && entry.first.Scalar() == *key) {
                    key_mark = entry.first.Mark();
                    next.reset(entry.second);
                    found = true;
                    break;
                }
            }
        } else {
            const auto index = std::get<std::size_t>(element);
            if (!current.IsSequence() || index >= current.size()) {
                return {};
            }
            key_mark = YAML::Mark::null_mark();
            next.reset(current[index]);
            found = true;
        }

        if (!found) {
            return {};
        }
        current.reset(next);
    }

    if (part == PathPart::Key && !key_mark.is_null()) {
        return position_from_mark(content, key_mark);
    }
    return position_from_mark(content, current.Mark());
}

std::optional<Diagnostic>
yamlview::diagnostic_at_path(const Source& source,
                             const YamlPath& path,
                             const std::string& message,
                             PathPart part) {
    auto position = resolve_yaml_path(source, path, part);
    if (!position) {
        return {};
    }
    return Diagnostic{message, *position};
}

std::string
yamlview::render_diagnostic(const Printer& printer,
                            const Source& source,
                            const Diagnostic& diagnostic,
                            int64_t context_lines) {
    return render_diagnostics(printer, source, {diagnostic}, context_lines);
}

std::string
yamlview::render_diagnostics(const Printer& printer,
                             const Source& source,
                             std::vector<Diagnostic> diagnostics,
                             int64_t context_lines) {
    std::stable_sort(diagnostics.begin(), diagnostics.end(), [](const Diagnostic& a, const Diagnostic& b) {
        return a.position < b.position;
    });

    const auto& options = printer.options();
    const auto& header_style = options.styles.style(Category::GenericError);

    std::vector<std::string> headers;
    for (const auto& diagnostic : diagnostics) {
        headers.push_back(header_style.render(
            fmt::format("{}:{}: {}", diagnostic.position.line, diagnostic.position.column, diagnostic.message),
            options.color_profile));
    }
    const auto header = fmt::format("{}", fmt::join(headers, "\n"));
    if (source.empty() || diagnostics.empty()) {
        return header;
    }

    const int64_t context = std::max<int64_t>(context_lines, 0);
    auto view = source.slice(1, source.line_count());

    std::vector<Span> windows;
    for (const auto& diagnostic : diagnostics) {
        const int64_t line = std::clamp<int64_t>(diagnostic.position.line, 1, source.line_count());
        const Position at{line, std::max<int64_t>(diagnostic.position.column, 1)};

        view->add_overlay(Category::GenericErrorInvalid, offending_span(*view, at));
        view->annotate(line, {diagnostic.message, at.column, Annotation::Placement::Below});
        windows.push_back(Span::lines(std::max<int64_t>(line - context, 1), std::min(line + context, source.line_count())));
    }

    return header + "\n" + printer.print_spans(*view, union_adjacent_or_overlapping(windows));
}
