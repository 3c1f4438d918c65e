#include "TreeScanner.h"
#include "PathBuilder.h"

#include <algorithm>
#include <iostream>
#include <vector>

namespace cptree {

namespace fs = std::filesystem;

// ============================================================================
// PathVisitor defaults
// ============================================================================

bool PathVisitor::filter(const fs::directory_entry& entry, std::error_code& ec) {
    (void)entry;
    (void)ec;
    return true;
}

void PathVisitor::visit(const fs::directory_entry& entry, std::error_code& ec) {
    (void)entry;
    (void)ec;
}

bool PathVisitor::handleError(const std::error_code& ec,
                              const fs::path& directory,
                              const fs::directory_entry* entry) {
    if (ec == std::errc::permission_denied) {
        if (entry) {
            std::cerr << "cptree: Permission denied reading `" << entry->path().string()
                      << "`: " << ec.message() << std::endl;
        } else {
            std::cerr << "cptree: Permission denied reading item in `" << directory.string()
                      << "`: " << ec.message() << std::endl;
        }
        return false;
    }
    return true;
}

// ============================================================================
// TreeScanner
// ============================================================================

TreeScanner::TreeScanner(ScanOptions options)
    : options_(options) {}

PathBuffer TreeScanner::scan(const std::string& rootPath, std::error_code& ec) {
    PathVisitor visitor;
    return scan(rootPath, visitor, ec);
}

PathBuffer TreeScanner::scan(const std::string& rootPath, PathVisitor& visitor,
                             std::error_code& ec) {
    ec.clear();
    stats_ = ScanStats{};

    PathBuilder builder(rootPath);
    if (!processDir(fs::path(rootPath), builder, visitor, 0, ec)) {
        return PathBuffer();
    }
    return builder.finish();
}

bool TreeScanner::processDir(const fs::path& dirPath, PathBuilder& builder,
                             PathVisitor& visitor, int depth, std::error_code& ec) {
    if (depth >= options_.maxDepth || cancelRequested.load()) {
        return true;
    }

    std::error_code dirEc;
    auto dirIt = fs::directory_iterator(dirPath, dirEc);
    if (dirEc) {
        // Failing to open the root is always fatal.
        if (depth == 0 || visitor.handleError(dirEc, dirPath, nullptr)) {
            ec = dirEc;
            return false;
        }
        return true;
    }

    std::vector<fs::directory_entry> entries;
    while (dirIt != fs::directory_iterator()) {
        entries.push_back(*dirIt);

        // Advance iterator using non-throwing overload
        dirIt.increment(dirEc);
        if (dirEc) {
            if (visitor.handleError(dirEc, dirPath, nullptr)) {
                ec = dirEc;
                return false;
            }
            break;
        }
    }

    if (options_.sortEntries) {
        std::sort(entries.begin(), entries.end(),
            [](const fs::directory_entry& a, const fs::directory_entry& b) {
                return a.path().filename().native() < b.path().filename().native();
            });
    }

    for (const auto& entry : entries) {
        if (cancelRequested.load()) {
            break;
        }
        if (!addEntry(dirPath, entry, builder, visitor, depth, ec)) {
            return false;
        }
    }
    return true;
}

bool TreeScanner::addEntry(const fs::path& dirPath, const fs::directory_entry& entry,
                           PathBuilder& builder, PathVisitor& visitor, int depth,
                           std::error_code& ec) {
    std::error_code entryEc;
    bool include = visitor.filter(entry, entryEc);
    if (!entryEc && include) {
        visitor.visit(entry, entryEc);
    }

    // Resolve the type before touching the builder so a skipped entry
    // never leaves a half-open directory behind.
    fs::file_status status;
    if (!entryEc && include) {
        status = entry.symlink_status(entryEc);
    }

    if (entryEc) {
        if (visitor.handleError(entryEc, dirPath, &entry)) {
            ec = entryEc;
            return false;
        }
        return true;
    }
    if (!include) {
        return true;
    }

    countEntry(entry, status.type());

    std::string name = entry.path().filename().string();
    if (status.type() != fs::file_type::directory) {
        builder.leaf(name);
        return true;
    }

    builder.enter(name);
    bool ok = processDir(entry.path(), builder, visitor, depth + 1, ec);
    builder.leave();
    return ok;
}

void TreeScanner::countEntry(const fs::directory_entry& entry, fs::file_type type) {
    switch (type) {
        case fs::file_type::directory:
            stats_.dirs++;
            break;
        case fs::file_type::regular: {
            stats_.files++;
            std::error_code ec;
            auto size = entry.file_size(ec);
            if (!ec) {
                stats_.bytes += static_cast<int64_t>(size);
            }
            break;
        }
        case fs::file_type::symlink:
            stats_.symlinks++;
            break;
        default:
            stats_.others++;
            break;
    }
    stats_.items++;
}

} // namespace cptree
