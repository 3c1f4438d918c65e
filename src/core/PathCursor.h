#pragma once

#include "Types.h"

#include <cstddef>
#include <iterator>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace cptree {

class PathBuffer;

// ============================================================================
// PathCursor - single-pass replay of a buffer's tokens
//
// Keeps a private stack of open components and a read position. Each Name
// token pushes and yields one item; each ascend token pops. A cursor shares
// ownership of the buffer storage, so it stays valid after the PathBuffer it
// was created from is gone. Create a new cursor to restart.
// ============================================================================

class PathCursor {
public:
    explicit PathCursor(const PathBuffer& buffer);

    // Move to the next item. Returns false once every token is consumed.
    // Throws TreeError(ERR_CORRUPT_BUFFER) on an ascend with nothing open;
    // the cursor is exhausted afterwards.
    bool advance();

    // Components of the current item, root first. Views stay valid while
    // this cursor (or any owner of the buffer) lives.
    const std::vector<std::string_view>& components() const { return stack_; }

    // Owned copy of the current item's components.
    std::vector<std::string> path() const;

    size_t depth() const { return stack_.size(); }

    // 0-based position of the current item among all items.
    size_t index() const { return index_; }

    bool done() const { return done_; }

private:
    std::shared_ptr<const std::string> data_;
    size_t pos_ = 0;
    size_t index_ = 0;
    size_t yielded_ = 0;
    bool done_ = false;
    std::vector<std::string_view> stack_;
};

// ============================================================================
// PathIterator - input iterator over a buffer's items, for range-for
// ============================================================================

class PathIterator {
public:
    using iterator_category = std::input_iterator_tag;
    using value_type        = std::vector<std::string_view>;
    using difference_type   = std::ptrdiff_t;
    using pointer           = const value_type*;
    using reference         = const value_type&;

    // End iterator.
    PathIterator() = default;

    // Iterator positioned on the first item of buffer (or end if empty).
    explicit PathIterator(const PathBuffer& buffer);

    reference operator*() const { return cursor_->components(); }
    pointer operator->() const { return &cursor_->components(); }

    PathIterator& operator++();

    bool operator==(const PathIterator& other) const;
    bool operator!=(const PathIterator& other) const { return !(*this == other); }

private:
    std::shared_ptr<PathCursor> cursor_;
};

} // namespace cptree
