#pragma once

#include <string>

namespace cptree {

class PathBuffer;
struct ScanStats;

// ============================================================================
// App - the cptree command line tool
//
// Scans a directory into a compact tree, then reports statistics, prints
// the encoded form, lists the paths or verifies them against the disk.
// ============================================================================

class App {
public:
    // Parse arguments and load configuration. Returns false on a usage
    // error (already reported).
    bool init(int argc, char* argv[]);

    // Returns the process exit status.
    int run();

    static void printUsage(const char* argv0);

    // Check every path of tree exists on disk and that the tree holds as
    // many items as the scan counted. Problems are reported to stderr.
    bool verifyPaths(const PathBuffer& tree, const ScanStats& stats) const;

private:
    int scanAndReport();
    void printStats(const PathBuffer& tree, const ScanStats& stats, double seconds) const;
    void listPaths(const PathBuffer& tree) const;

    std::string argv0_ = "cptree";
    std::string rootPath_;
    std::string configPath_;
    bool helpRequested_ = false;

    // Output switches given on the command line.
    bool optStats_ = false;
    bool optEncoded_ = false;
    bool optList_ = false;
    bool optVerify_ = false;
    bool optSort_ = false;
    int optMaxDepth_ = 0;
};

} // namespace cptree
