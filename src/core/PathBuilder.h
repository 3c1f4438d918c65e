#pragma once

#include "PathBuffer.h"

#include <cstddef>
#include <string>
#include <vector>

namespace cptree {

// ============================================================================
// PathBuilder - turns a depth-first traversal into a PathBuffer
//
// Two surfaces share one stack of open components:
//   streaming:  enter(name) / leaf(name) / leave()
//   whole-path: addPath({"outer", "b", "c"})
// A builder is used by a single producer and is spent by finish().
// ============================================================================

class PathBuilder {
public:
    explicit PathBuilder(std::string root = std::string());

    // Open a directory item. Throws TreeError(ERR_INVALID_COMPONENT).
    void enter(const std::string& name);

    // Item with no children: enter(name) followed by leave().
    void leaf(const std::string& name);

    // Close the most recently entered item. Throws
    // TreeError(ERR_UNBALANCED_LEAVE) when nothing is open.
    void leave();

    // Append an item given by its full path. The path must extend the
    // common prefix with the open path by exactly one component, otherwise
    // TreeError(ERR_NOT_DEPTH_FIRST) is thrown and the builder halts.
    void addPath(const std::vector<std::string>& components);

    // Number of currently open components.
    size_t depth() const { return stack_.size(); }

    size_t itemCount() const { return names_; }

    // Hand over the tokens. Open items are left open.
    PathBuffer finish();

    static PathBuffer fromPaths(const std::vector<std::vector<std::string>>& paths,
                                const std::string& root = std::string());

private:
    void checkUsable() const;
    static void checkComponent(const std::string& name);

    void appendName(const std::string& name);
    void appendAscend();

    std::string root_;
    std::string data_;
    std::vector<std::string> stack_;
    size_t names_ = 0;
    size_t ascends_ = 0;
    bool halted_ = false;
    bool finished_ = false;
};

} // namespace cptree
