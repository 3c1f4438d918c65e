#include "PathBuilder.h"
#include "TreeError.h"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace cptree {

PathBuilder::PathBuilder(std::string root)
    : root_(std::move(root)) {}

// ============================================================================
// Streaming surface
// ============================================================================

void PathBuilder::enter(const std::string& name) {
    checkUsable();
    checkComponent(name);

    appendName(name);
    stack_.push_back(name);
}

void PathBuilder::leaf(const std::string& name) {
    checkUsable();
    checkComponent(name);

    appendName(name);
    appendAscend();
}

void PathBuilder::leave() {
    checkUsable();
    if (stack_.empty()) {
        throw TreeError(ERR_UNBALANCED_LEAVE, "leave() with no open directory");
    }

    appendAscend();
    stack_.pop_back();
}

// ============================================================================
// Whole-path surface
// ============================================================================

void PathBuilder::addPath(const std::vector<std::string>& components) {
    checkUsable();
    for (const std::string& c : components) {
        checkComponent(c);
    }

    if (components.empty()) {
        halted_ = true;
        throw TreeError(ERR_NOT_DEPTH_FIRST,
                        "empty path at item " + std::to_string(names_));
    }

    auto mismatch = std::mismatch(stack_.begin(), stack_.end(),
                                  components.begin(), components.end());
    size_t common = static_cast<size_t>(mismatch.first - stack_.begin());

    if (components.size() <= common) {
        halted_ = true;
        throw TreeError(ERR_NOT_DEPTH_FIRST,
                        "item " + std::to_string(names_) +
                        " repeats an earlier item or one of its ancestors");
    }
    if (components.size() > common + 1) {
        halted_ = true;
        throw TreeError(ERR_NOT_DEPTH_FIRST,
                        "item " + std::to_string(names_) + " skips " +
                        std::to_string(components.size() - common - 1) +
                        " ancestor(s) never listed as items");
    }

    while (stack_.size() > common) {
        appendAscend();
        stack_.pop_back();
    }
    appendName(components.back());
    stack_.push_back(components.back());
}

// ============================================================================
// finish / fromPaths
// ============================================================================

PathBuffer PathBuilder::finish() {
    checkUsable();
    finished_ = true;

    data_.shrink_to_fit();
    PathBuffer buffer(std::move(data_), std::move(root_), names_, ascends_);

    data_.clear();
    stack_.clear();
    names_ = 0;
    ascends_ = 0;
    return buffer;
}

PathBuffer PathBuilder::fromPaths(const std::vector<std::vector<std::string>>& paths,
                                  const std::string& root) {
    PathBuilder builder(root);
    for (const auto& path : paths) {
        builder.addPath(path);
    }
    return builder.finish();
}

// ============================================================================
// Helpers
// ============================================================================

void PathBuilder::checkUsable() const {
    if (finished_) {
        throw std::logic_error("PathBuilder: used after finish()");
    }
    if (halted_) {
        throw TreeError(ERR_NOT_DEPTH_FIRST, "builder halted by an earlier out-of-order path");
    }
}

void PathBuilder::checkComponent(const std::string& name) {
    if (!isValidComponent(name)) {
        throw TreeError(ERR_INVALID_COMPONENT, "invalid component \"" + name + "\"");
    }
}

void PathBuilder::appendName(const std::string& name) {
    data_ += name;
    data_ += PATH_SEPARATOR;
    names_++;
}

void PathBuilder::appendAscend() {
    data_.append(ASCEND_MARKER.data(), ASCEND_MARKER.size());
    data_ += PATH_SEPARATOR;
    ascends_++;
}

} // namespace cptree
