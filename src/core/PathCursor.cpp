#include "PathCursor.h"
#include "PathBuffer.h"
#include "TreeError.h"

namespace cptree {

// ============================================================================
// PathCursor
// ============================================================================

PathCursor::PathCursor(const PathBuffer& buffer)
    : data_(buffer.storage()) {}

bool PathCursor::advance() {
    if (done_) {
        return false;
    }

    const std::string& data = *data_;
    while (pos_ < data.size()) {
        size_t end = data.find(PATH_SEPARATOR, pos_);
        if (end == std::string::npos) {
            end = data.size();
        }
        std::string_view token(data.data() + pos_, end - pos_);
        size_t offset = pos_;
        pos_ = end + 1;

        if (token == ASCEND_MARKER) {
            if (stack_.empty()) {
                done_ = true;
                pos_ = data.size();
                throw TreeError(ERR_CORRUPT_BUFFER,
                                "ascend with empty stack at offset " + std::to_string(offset));
            }
            stack_.pop_back();
            continue;
        }

        stack_.push_back(token);
        index_ = yielded_++;
        return true;
    }

    done_ = true;
    return false;
}

std::vector<std::string> PathCursor::path() const {
    return std::vector<std::string>(stack_.begin(), stack_.end());
}

// ============================================================================
// PathIterator
// ============================================================================

PathIterator::PathIterator(const PathBuffer& buffer)
    : cursor_(std::make_shared<PathCursor>(buffer)) {
    ++*this;
}

PathIterator& PathIterator::operator++() {
    if (!cursor_) {
        return *this;
    }
    try {
        if (!cursor_->advance()) {
            cursor_.reset();
        }
    } catch (const TreeError&) {
        // A corrupt buffer ends the iteration.
        cursor_.reset();
        throw;
    }
    return *this;
}

bool PathIterator::operator==(const PathIterator& other) const {
    // Input iterators over the same pass compare equal only at the end or
    // when they share the cursor.
    return cursor_ == other.cursor_;
}

} // namespace cptree
