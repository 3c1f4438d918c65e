#include "PathBuffer.h"
#include "TreeError.h"

#include <utility>

namespace cptree {

// One shared empty string backs every empty buffer.
const std::shared_ptr<const std::string>& PathBuffer::emptyStorage() {
    static const std::shared_ptr<const std::string> empty =
        std::make_shared<const std::string>();
    return empty;
}

PathBuffer::PathBuffer()
    : data_(emptyStorage()) {}

PathBuffer::PathBuffer(std::string data, std::string root, size_t names, size_t ascends)
    : data_(std::make_shared<const std::string>(std::move(data))),
      root_(std::move(root)),
      names_(names),
      ascends_(ascends) {}

PathBuffer::PathBuffer(PathBuffer&& other) noexcept
    : PathBuffer() {
    *this = std::move(other);
}

PathBuffer& PathBuffer::operator=(PathBuffer&& other) noexcept {
    if (this != &other) {
        data_ = std::move(other.data_);
        root_ = std::move(other.root_);
        names_ = other.names_;
        ascends_ = other.ascends_;

        other.data_ = emptyStorage();
        other.root_.clear();
        other.names_ = 0;
        other.ascends_ = 0;
    }
    return *this;
}

// ============================================================================
// fromEncoded - rebuild storage from "a/b/../c" text
// ============================================================================
PathBuffer PathBuffer::fromEncoded(const std::string& encoded, const std::string& root) {
    std::string data = encoded;
    if (!data.empty() && data.back() != PATH_SEPARATOR) {
        data += PATH_SEPARATOR;
    }

    size_t names = 0;
    size_t ascends = 0;
    size_t pos = 0;
    while (pos < data.size()) {
        size_t end = data.find(PATH_SEPARATOR, pos);
        if (end == pos) {
            throw TreeError(ERR_CORRUPT_BUFFER,
                            "empty token at offset " + std::to_string(pos));
        }
        std::string_view token(data.data() + pos, end - pos);
        if (token == ASCEND_MARKER) {
            ascends++;
        } else {
            names++;
        }
        pos = end + 1;
    }

    return PathBuffer(std::move(data), root, names, ascends);
}

std::vector<Token> PathBuffer::tokens() const {
    std::vector<Token> result;
    result.reserve(tokenCount());

    const std::string& data = *data_;
    size_t pos = 0;
    while (pos < data.size()) {
        size_t end = data.find(PATH_SEPARATOR, pos);
        std::string_view text(data.data() + pos, end - pos);
        if (text == ASCEND_MARKER) {
            result.push_back(Token{TOKEN_ASCEND, std::string_view()});
        } else {
            result.push_back(Token{TOKEN_NAME, text});
        }
        pos = end + 1;
    }
    return result;
}

std::string PathBuffer::encoded() const {
    const std::string& data = *data_;
    if (data.empty()) {
        return std::string();
    }
    return data.substr(0, data.size() - 1);
}

size_t PathBuffer::byteSize() const {
    return data_->capacity();
}

bool PathBuffer::isWellFormed() const {
    size_t depth = 0;
    for (const Token& token : tokens()) {
        if (token.isName()) {
            depth++;
        } else if (depth == 0) {
            return false;
        } else {
            depth--;
        }
    }
    return true;
}

} // namespace cptree
