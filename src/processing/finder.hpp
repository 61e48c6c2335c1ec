#pragma once

/*
    Substring search over normalized source text.

    Each line is normalized one code point at a time, and every byte of the
    normalized text remembers the column it came from. Matches found in the
    normalized text are mapped back to spans of the original lines.
*/

#include "processing/normalizer.hpp"
#include "processing/position.hpp"
#include "processing/source.hpp"

#include <cstdint>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

namespace yamlview {

struct FinderOptions {
    // Applied to both the source text and queries. A default Normalizer
    // (case and diacritic folding) is used when unset.
    std::shared_ptr<const Normalizer> normalizer;
};

class Finder {
   public:
    explicit Finder(FinderOptions options = {});

    // Index `source`, replacing any previous index. Only a weak reference to
    // the source is kept.
    void
    load(const std::shared_ptr<const Source>& source);

    // Non-overlapping matches in source order, leftmost first. Empty for an
    // empty query, before load, or once the loaded source is gone. Safe to
    // call concurrently, but not concurrently with load.
    std::vector<Span>
    find(const std::string& query) const;

    bool
    loaded() const;

    const Normalizer&
    normalizer() const {
        return *normalizer_;
    }

   private:
    struct IndexedLine {
        std::string normalized;

        // Original column of each byte in `normalized`.
        std::vector<int64_t> columns;

        int64_t column_count = 0;
    };

    std::shared_ptr<const Normalizer> normalizer_;
    std::weak_ptr<const Source> source_;
    std::vector<IndexedLine> lines_;
    mutable std::shared_mutex mutex_;
};

}  // namespace yamlview
