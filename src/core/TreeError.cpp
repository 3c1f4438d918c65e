#include "TreeError.h"

namespace cptree {

const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ERR_INVALID_COMPONENT: return "InvalidComponent";
        case ERR_UNBALANCED_LEAVE:  return "UnbalancedLeave";
        case ERR_NOT_DEPTH_FIRST:   return "NotDepthFirst";
        case ERR_CORRUPT_BUFFER:    return "CorruptBuffer";
        default:                    return "Unknown";
    }
}

TreeError::TreeError(ErrorKind kind, const std::string& what)
    : std::runtime_error(std::string(errorKindName(kind)) + ": " + what),
      kind_(kind) {}

} // namespace cptree
