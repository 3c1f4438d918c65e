#include "PathFormat.h"

namespace cptree {
namespace PathFormat {

std::string joinPath(const std::vector<std::string_view>& components, char sep) {
    std::string result;
    for (size_t i = 0; i < components.size(); ++i) {
        if (i > 0) {
            result += sep;
        }
        result.append(components[i].data(), components[i].size());
    }
    return result;
}

std::string joinPath(const std::string& root,
                     const std::vector<std::string_view>& components,
                     char sep) {
    if (root.empty()) {
        return joinPath(components, sep);
    }

    std::string result = root;
    if (!components.empty() && result.back() != sep) {
        result += sep;
    }
    result += joinPath(components, sep);
    return result;
}

std::vector<std::string> splitPath(const std::string& text, char sep) {
    std::vector<std::string> parts;
    size_t pos = 0;
    while (pos <= text.size()) {
        size_t end = text.find(sep, pos);
        if (end == std::string::npos) {
            end = text.size();
        }
        if (end > pos) {
            parts.push_back(text.substr(pos, end - pos));
        }
        pos = end + 1;
    }
    return parts;
}

} // namespace PathFormat
} // namespace cptree
