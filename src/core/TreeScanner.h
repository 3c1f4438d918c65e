#pragma once

#include "PathBuffer.h"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <string>
#include <system_error>

namespace cptree {

class PathBuilder;

// ============================================================================
// Scan statistics and options
// ============================================================================

struct ScanStats {
    int64_t files = 0;
    int64_t dirs = 0;
    int64_t symlinks = 0;
    int64_t others = 0;
    int64_t items = 0;
    int64_t bytes = 0;  // total size of regular files
};

struct ScanOptions {
    int maxDepth = 128;        // directories deeper than this are not read
    bool sortEntries = false;  // sort names within each directory
};

// ============================================================================
// PathVisitor - decides what goes into the tree and which errors are fatal
// ============================================================================

class PathVisitor {
public:
    virtual ~PathVisitor() = default;

    // Return false to omit the entry (and, for a directory, everything
    // below it). Setting ec omits the entry and routes ec to handleError.
    virtual bool filter(const std::filesystem::directory_entry& entry, std::error_code& ec);

    // Called for every included entry, after filter.
    virtual void visit(const std::filesystem::directory_entry& entry, std::error_code& ec);

    // Return true when ec should stop the scan. entry is null for errors
    // reading the directory itself. Default: permission errors are logged
    // and ignored, everything else is fatal.
    virtual bool handleError(const std::error_code& ec,
                             const std::filesystem::path& directory,
                             const std::filesystem::directory_entry* entry);
};

// ============================================================================
// TreeScanner - depth-first directory walk feeding a PathBuilder
// ============================================================================

class TreeScanner {
public:
    explicit TreeScanner(ScanOptions options = ScanOptions());

    // Scan the tree below rootPath (the root itself is not an item).
    // Symbolic links are stored but not followed. On a fatal error ec is
    // set and an empty buffer is returned.
    PathBuffer scan(const std::string& rootPath, PathVisitor& visitor, std::error_code& ec);

    // Scan with the default visitor.
    PathBuffer scan(const std::string& rootPath, std::error_code& ec);

    const ScanStats& stats() const { return stats_; }
    const ScanOptions& options() const { return options_; }

    // Set from another thread to stop a running scan; the items gathered
    // so far are returned.
    std::atomic<bool> cancelRequested{false};

private:
    // Returns false on a fatal error (stored in ec).
    bool processDir(const std::filesystem::path& dirPath, PathBuilder& builder,
                    PathVisitor& visitor, int depth, std::error_code& ec);

    bool addEntry(const std::filesystem::path& dirPath,
                  const std::filesystem::directory_entry& entry,
                  PathBuilder& builder, PathVisitor& visitor, int depth,
                  std::error_code& ec);

    void countEntry(const std::filesystem::directory_entry& entry,
                    std::filesystem::file_type type);

    ScanOptions options_;
    ScanStats stats_{};
};

} // namespace cptree
