#pragma once

#include <stdexcept>
#include <string>

namespace cptree {

// ============================================================================
// Error taxonomy
// ============================================================================

enum ErrorKind {
    ERR_INVALID_COMPONENT = 0,  // empty name, separator inside, or ".."
    ERR_UNBALANCED_LEAVE,       // leave() with nothing open
    ERR_NOT_DEPTH_FIRST,        // whole-path input out of depth-first order
    ERR_CORRUPT_BUFFER,         // buffer violates the depth invariant
    NUM_ERROR_KINDS
};

// Short stable name for an error kind, e.g. "InvalidComponent".
const char* errorKindName(ErrorKind kind);

// ============================================================================
// TreeError - thrown by the builder, buffer and cursor
// ============================================================================

class TreeError : public std::runtime_error {
public:
    TreeError(ErrorKind kind, const std::string& what);

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

} // namespace cptree
