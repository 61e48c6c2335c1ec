#include "processing/revision.hpp"

#include <algorithm>
#include <cassert>
#include <stdexcept>

using namespace yamlview;

Revision::Revision(Token, SourcePtr source) : source_(std::move(source)) {
    assert(source_);
}

std::shared_ptr<Revision>
Revision::create(SourcePtr source) {
    if (!source) {
        throw std::invalid_argument("revision requires a source");
    }
    return std::make_shared<Revision>(Token{}, std::move(source));
}

std::shared_ptr<Revision>
Revision::append(SourcePtr source) {
    auto revision = create(std::move(source));
    revision->parent_ = shared_from_this();
    child_ = revision;
    return revision;
}

std::shared_ptr<Revision>
Revision::prepend(SourcePtr source) {
    if (!at_origin()) {
        throw std::logic_error("prepend is only valid at the origin revision");
    }
    auto revision = create(std::move(source));
    revision->child_ = shared_from_this();
    parent_ = revision;
    return revision;
}

std::shared_ptr<Revision>
Revision::origin() {
    auto current = shared_from_this();
    while (current->parent_) {
        current = current->parent_;
    }
    return current;
}

std::shared_ptr<Revision>
Revision::tip() {
    auto current = shared_from_this();
    while (auto next = current->child()) {
        current = next;
    }
    return current;
}

std::shared_ptr<Revision>
Revision::seek(int64_t n) {
    auto current = shared_from_this();
    for (; n > 0; n--) {
        auto next = current->child();
        if (!next) {
            break;
        }
        current = next;
    }
    for (; n < 0; n++) {
        if (!current->parent_) {
            break;
        }
        current = current->parent_;
    }
    return current;
}

std::shared_ptr<Revision>
Revision::at(int64_t index) {
    return origin()->seek(std::max<int64_t>(index, 0));
}

int64_t
Revision::index() const {
    int64_t result = 0;
    for (auto p = parent_; p; p = p->parent_) {
        result++;
    }
    return result;
}

int64_t
Revision::count() const {
    int64_t after = 0;
    for (auto c = child(); c; c = c->child()) {
        after++;
    }
    return index() + 1 + after;
}

std::vector<std::string>
Revision::names() {
    std::vector<std::string> result;
    for (auto r = origin(); r; r = r->child()) {
        result.push_back(r->name().value_or(""));
    }
    return result;
}
