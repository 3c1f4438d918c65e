#pragma once

#include "Types.h"

#include <string>
#include <string_view>
#include <vector>

namespace cptree {
namespace PathFormat {

    // Join components with sep, e.g. {"a", "b"} -> "a/b".
    std::string joinPath(const std::vector<std::string_view>& components,
                         char sep = PATH_SEPARATOR);

    // Same, prefixed with root. No separator is doubled when root already
    // ends with sep; an empty root yields the plain join.
    std::string joinPath(const std::string& root,
                         const std::vector<std::string_view>& components,
                         char sep = PATH_SEPARATOR);

    // Split text on sep, dropping empty segments ("/a//b/" -> {"a", "b"}).
    std::vector<std::string> splitPath(const std::string& text,
                                       char sep = PATH_SEPARATOR);

} // namespace PathFormat
} // namespace cptree
