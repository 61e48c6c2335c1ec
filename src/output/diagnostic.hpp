#pragma once

#include "output/printer.hpp"
#include "processing/position.hpp"
#include "processing/source.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace yamlview {

struct Diagnostic {
    std::string message;
    Position position;
};

// Mapping keys and sequence indices leading from the document root to a node.
class YamlPath {
   public:
    using Element = std::variant<std::string, std::size_t>;

    static YamlPath
    root() {
        return {};
    }

    // "$.spec.ports[0].name"; the leading "$" is optional. nullopt for
    // malformed text such as an unterminated or non-numeric index.
    static std::optional<YamlPath>
    parse(const std::string& text);

    YamlPath&
    child(const std::string& key) {
        elements_.emplace_back(key);
        return *this;
    }

    YamlPath&
    index(std::size_t i) {
        elements_.emplace_back(i);
        return *this;
    }

    const std::vector<Element>&
    elements() const {
        return elements_;
    }

    std::string
    to_string() const;

   private:
    std::vector<Element> elements_;
};

enum class PathPart { Key, Value };

// First parse error in the YAML stream, if any.
std::optional<Diagnostic>
validate_yaml(const Source& source);

// Position of the node `path` names in the first document. With PathPart::Key
// the mapping key is used when the last element is a key. nullopt when the
// text does not parse or the path does not exist.
std::optional<Position>
resolve_yaml_path(const Source& source, const YamlPath& path, PathPart part = PathPart::Value);

std::optional<Diagnostic>
diagnostic_at_path(const Source& source,
                   const YamlPath& path,
                   const std::string& message,
                   PathPart part = PathPart::Value);

// Header line followed by the lines around the diagnostic, with the offending
// token highlighted and the message annotated below it.
std::string
render_diagnostic(const Printer& printer,
                  const Source& source,
                  const Diagnostic& diagnostic,
                  int64_t context_lines = 2);

// One header line per diagnostic, in source order, then the context windows of
// all diagnostics. Windows that touch or overlap print as one block.
std::string
render_diagnostics(const Printer& printer,
                   const Source& source,
                   std::vector<Diagnostic> diagnostics,
                   int64_t context_lines = 2);

}  // namespace yamlview
