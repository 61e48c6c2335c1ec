#include "processing/finder.hpp"

#include "util/utf8decode.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <mutex>
#include <unordered_map>

//#define LOCAL_DEBUG

using namespace yamlview;

Finder::Finder(FinderOptions options) : normalizer_(std::move(options.normalizer)) {
    if (!normalizer_) {
        normalizer_ = std::make_shared<Normalizer>();
    }
}

void
Finder::load(const std::shared_ptr<const Source>& source) {
    std::vector<IndexedLine> lines;

    if (source) {
        // Sources repeat the same few code points; normalize each once.
        std::unordered_map<char32_t, std::string> folded;

        lines.reserve(static_cast<std::size_t>(source->line_count()));
        for (const auto& line : source->lines()) {
            IndexedLine indexed;
            int64_t column = 1;
            std::string::size_type offset = 0;
            while (offset < line.text.size()) {
                const char32_t cp = utf8_next(line.text, &offset);

                auto it = folded.find(cp);
                if (it == folded.end()) {
                    std::string original;
                    utf8_append(original, cp);
                    it = folded.emplace(cp, normalizer_->normalize(original)).first;
                }

                indexed.normalized += it->second;
                indexed.columns.insert(indexed.columns.end(), it->second.size(), column);
                column++;
            }
            indexed.column_count = column - 1;
            lines.push_back(std::move(indexed));
        }
    }

    std::unique_lock lock(mutex_);
    source_ = source;
    lines_ = std::move(lines);

#ifdef LOCAL_DEBUG
    fmt::print("finder: indexed {} lines\n", lines_.size());
#endif
}

bool
Finder::loaded() const {
    std::shared_lock lock(mutex_);
    return !source_.expired();
}

std::vector<Span>
Finder::find(const std::string& query) const {
    std::vector<Span> result;
    if (query.empty()) {
        return result;
    }

    const std::string needle = normalizer_->normalize(query);
    if (needle.empty()) {
        return result;
    }

    std::shared_lock lock(mutex_);
    if (source_.expired()) {
        return result;
    }

    for (std::size_t i = 0; i < lines_.size(); i++) {
        const auto& line = lines_[i];
        const auto n = static_cast<int64_t>(i) + 1;

        std::string::size_type pos = line.normalized.find(needle);
        while (pos != std::string::npos) {
            const int64_t start = line.columns[pos];
            int64_t end = line.columns[pos + needle.size() - 1] + 1;

            // Characters that normalize to nothing (combining marks) after the
            // match belong to it.
            const std::string::size_type after = pos + needle.size();
            const int64_t next = after < line.columns.size() ? line.columns[after] : line.column_count + 1;
            end = std::max(end, next);

            // One original character may fold to several; keep one span per
            // start column.
            if (!result.empty() && result.back().start() == Position{n, start}) {
                if (result.back().end().column < end) {
                    result.back() = Span({n, start}, {n, end});
                }
            } else {
                result.emplace_back(Position{n, start}, Position{n, end});
            }

            pos = line.normalized.find(needle, pos + needle.size());
        }
    }

    return result;
}
