#pragma once

#include <cstddef>
#include <string_view>

namespace cptree {

// ============================================================================
// Reserved characters and markers
// ============================================================================

// Terminates every token in a buffer. Component names may never contain it.
constexpr char PATH_SEPARATOR = '/';

// Text of the ascend token ("go up one level").
constexpr std::string_view ASCEND_MARKER = "..";

// ============================================================================
// Tokens
// ============================================================================

enum TokenKind {
    TOKEN_NAME = 0,
    TOKEN_ASCEND,
    NUM_TOKEN_KINDS
};

struct Token {
    TokenKind kind = TOKEN_NAME;
    std::string_view name;  // empty for TOKEN_ASCEND

    bool isName() const { return kind == TOKEN_NAME; }
    bool isAscend() const { return kind == TOKEN_ASCEND; }
};

inline bool operator==(const Token& a, const Token& b) {
    return a.kind == b.kind && a.name == b.name;
}

inline bool operator!=(const Token& a, const Token& b) {
    return !(a == b);
}

// A component is usable as a Name token when it is non-empty, is not the
// ascend marker and holds no separator.
inline bool isValidComponent(std::string_view name) {
    return !name.empty()
        && name != ASCEND_MARKER
        && name.find(PATH_SEPARATOR) == std::string_view::npos;
}

} // namespace cptree
