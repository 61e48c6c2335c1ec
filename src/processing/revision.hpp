#pragma once

#include "processing/source.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace yamlview {

// A source at one point in a chain of revisions. Each revision owns its parent;
// links toward the tip are weak, so a revision stays reachable from later
// revisions only while someone holds the later ones.
class Revision : public std::enable_shared_from_this<Revision> {
    // Restricts construction to create().
    struct Token {
        explicit Token() = default;
    };

   public:
    Revision(Token, SourcePtr source);

    static std::shared_ptr<Revision>
    create(SourcePtr source);

    // Add a revision after this one and return it. Revisions that followed
    // this one are cut off.
    std::shared_ptr<Revision>
    append(SourcePtr source);

    // Add a revision before this one and return it. Throws std::logic_error
    // unless this is the origin.
    std::shared_ptr<Revision>
    prepend(SourcePtr source);

    const SourcePtr&
    source() const {
        return source_;
    }

    const std::optional<std::string>&
    name() const {
        return source_->name();
    }

    // nullptr at the origin.
    std::shared_ptr<Revision>
    parent() const {
        return parent_;
    }

    // nullptr at the tip.
    std::shared_ptr<Revision>
    child() const {
        return child_.lock();
    }

    std::shared_ptr<Revision>
    origin();

    std::shared_ptr<Revision>
    tip();

    // Move `n` revisions toward the tip, or toward the origin when negative.
    // Stops at either end.
    std::shared_ptr<Revision>
    seek(int64_t n);

    // Zero-based, from the origin; clamps like seek.
    std::shared_ptr<Revision>
    at(int64_t index);

    bool
    at_origin() const {
        return parent_ == nullptr;
    }

    bool
    at_tip() const {
        return child_.expired();
    }

    // Distance from the origin.
    int64_t
    index() const;

    int64_t
    count() const;

    // Source names from origin to tip. Unnamed sources give an empty string.
    std::vector<std::string>
    names();

   private:
    SourcePtr source_;
    std::shared_ptr<Revision> parent_;
    std::weak_ptr<Revision> child_;
};

using RevisionPtr = std::shared_ptr<Revision>;

}  // namespace yamlview
