#pragma once

#include "PathCursor.h"
#include "Types.h"

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace cptree {

// ============================================================================
// PathBuffer - immutable flat token sequence describing a whole tree
//
// All tokens live in one string: each token is its text followed by
// PATH_SEPARATOR, ascend tokens are ASCEND_MARKER. Copies share the same
// storage. Items can only be streamed, never looked up.
// ============================================================================

class PathBuffer {
public:
    // Empty buffer (no items).
    PathBuffer();

    PathBuffer(const PathBuffer&) = default;
    PathBuffer& operator=(const PathBuffer&) = default;

    // A moved-from buffer is left empty.
    PathBuffer(PathBuffer&& other) noexcept;
    PathBuffer& operator=(PathBuffer&& other) noexcept;

    // Reload an encoded form as returned by encoded(). Only lexical checks
    // are made here (throws TreeError(ERR_CORRUPT_BUFFER) on an empty
    // token); depth balance is reported by cursors or isWellFormed().
    static PathBuffer fromEncoded(const std::string& encoded,
                                  const std::string& root = std::string());

    // Read-only token sequence. Names view this buffer's storage.
    std::vector<Token> tokens() const;

    size_t itemCount() const { return names_; }
    size_t ascendCount() const { return ascends_; }
    size_t tokenCount() const { return names_ + ascends_; }
    bool empty() const { return names_ == 0; }

    // Directory the tree was scanned from; empty when built by hand.
    const std::string& root() const { return root_; }

    // Tokens joined by PATH_SEPARATOR, e.g. "outer/a/../b".
    std::string encoded() const;

    // Bytes held by the token storage.
    size_t byteSize() const;

    // True when no prefix of the sequence ascends past the top.
    bool isWellFormed() const;

    PathCursor cursor() const { return PathCursor(*this); }
    PathIterator begin() const { return PathIterator(*this); }
    PathIterator end() const { return PathIterator(); }

    // Shared token storage, used by cursors.
    const std::shared_ptr<const std::string>& storage() const { return data_; }

private:
    friend class PathBuilder;

    PathBuffer(std::string data, std::string root, size_t names, size_t ascends);

    static const std::shared_ptr<const std::string>& emptyStorage();

    std::shared_ptr<const std::string> data_;
    std::string root_;
    size_t names_ = 0;
    size_t ascends_ = 0;
};

} // namespace cptree
