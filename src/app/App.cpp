#include "app/App.h"
#include "app/Config.h"

#include "core/PathBuffer.h"
#include "core/PathFormat.h"
#include "core/PlatformUtils.h"
#include "core/TreeError.h"
#include "core/TreeScanner.h"

#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <iostream>

namespace cptree {

void App::printUsage(const char* argv0) {
    std::cerr << "usage: " << argv0 << " [options] [root]\n"
              << "  -s, --stats        print scan statistics to stderr\n"
              << "  -e, --encoded      print the encoded tree to stdout\n"
              << "  -l, --list         print every path to stdout\n"
              << "      --verify       check every path exists on disk\n"
              << "      --sort         sort entries within each directory\n"
              << "      --max-depth N  do not read directories deeper than N\n"
              << "  -c, --config FILE  read settings from FILE\n"
              << "  -h, --help         show this help\n";
}

bool App::init(int argc, char* argv[]) {
    if (argc > 0) {
        argv0_ = argv[0];
    }

    // Parse command-line arguments
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        if (std::strcmp(arg, "-h") == 0 || std::strcmp(arg, "--help") == 0) {
            helpRequested_ = true;
        } else if (std::strcmp(arg, "-s") == 0 || std::strcmp(arg, "--stats") == 0) {
            optStats_ = true;
        } else if (std::strcmp(arg, "-e") == 0 || std::strcmp(arg, "--encoded") == 0) {
            optEncoded_ = true;
        } else if (std::strcmp(arg, "-l") == 0 || std::strcmp(arg, "--list") == 0) {
            optList_ = true;
        } else if (std::strcmp(arg, "--verify") == 0) {
            optVerify_ = true;
        } else if (std::strcmp(arg, "--sort") == 0) {
            optSort_ = true;
        } else if (std::strcmp(arg, "-c") == 0 || std::strcmp(arg, "--config") == 0) {
            if (i + 1 >= argc) {
                std::cerr << "cptree: " << arg << " needs a file" << std::endl;
                return false;
            }
            configPath_ = argv[++i];
        } else if (std::strcmp(arg, "--max-depth") == 0) {
            if (i + 1 >= argc) {
                std::cerr << "cptree: " << arg << " needs a value" << std::endl;
                return false;
            }
            const char* value = argv[++i];
            char* end = nullptr;
            long depth = std::strtol(value, &end, 10);
            if (*value == '\0' || *end != '\0' || depth <= 0) {
                std::cerr << "cptree: invalid depth \"" << value << "\"" << std::endl;
                return false;
            }
            optMaxDepth_ = static_cast<int>(depth);
        } else if (arg[0] == '-' && arg[1] != '\0') {
            std::cerr << "cptree: unknown option " << arg << std::endl;
            printUsage(argv0_.c_str());
            return false;
        } else if (rootPath_.empty()) {
            rootPath_ = arg;
        } else {
            std::cerr << "cptree: more than one root given" << std::endl;
            printUsage(argv0_.c_str());
            return false;
        }
    }

    // Load config
    Config& config = Config::instance();
    if (!configPath_.empty()) {
        if (!config.loadFrom(configPath_)) {
            return false;
        }
    } else {
        config.load();
    }

    // Root: CLI arg > config default > home > current dir
    if (rootPath_.empty()) {
        const char* home = std::getenv("HOME");
        if (!config.defaultRoot.empty()) {
            rootPath_ = config.defaultRoot;
        } else if (home && home[0] != '\0') {
            rootPath_ = home;
        } else {
            rootPath_ = ".";
        }
    }

    return true;
}

int App::run() {
    if (helpRequested_) {
        printUsage(argv0_.c_str());
        return 0;
    }

    try {
        return scanAndReport();
    } catch (const TreeError& e) {
        std::cerr << "cptree: internal error: " << e.what() << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "cptree: " << e.what() << std::endl;
    }
    return 1;
}

int App::scanAndReport() {
    const Config& config = Config::instance();

    ScanOptions options = config.scan;
    if (optSort_) {
        options.sortEntries = true;
    }
    if (optMaxDepth_ > 0) {
        options.maxDepth = optMaxDepth_;
    }

    bool stats = optStats_ || config.showStats;
    bool encoded = optEncoded_ || config.printEncoded;
    bool list = optList_ || config.listPaths;
    bool verify = optVerify_ || config.verifyPaths;
    if (!stats && !encoded && !list && !verify) {
        stats = verify = encoded = true;
    }

    std::cerr << "cptree: constructing tree from " << rootPath_ << std::endl;

    double start = PlatformUtils::getTime();
    TreeScanner scanner(options);
    std::error_code ec;
    PathBuffer tree = scanner.scan(rootPath_, ec);
    if (ec) {
        std::cerr << "cptree: scan of " << rootPath_ << " failed: " << ec.message() << std::endl;
        return 1;
    }
    double elapsed = PlatformUtils::getTime() - start;

    if (stats) {
        printStats(tree, scanner.stats(), elapsed);
    }
    if (verify && !verifyPaths(tree, scanner.stats())) {
        return 2;
    }
    if (list) {
        listPaths(tree);
    }
    if (encoded) {
        std::cout << tree.encoded() << std::endl;
    }
    return 0;
}

void App::printStats(const PathBuffer& tree, const ScanStats& stats, double seconds) const {
    // Bytes a plain list of full paths would take, for comparison.
    int64_t flatBytes = 0;
    for (const auto& components : tree) {
        for (const auto& c : components) {
            flatBytes += static_cast<int64_t>(c.size()) + 1;
        }
    }
    int64_t encodedBytes = static_cast<int64_t>(tree.encoded().size());

    std::cerr << "cptree: tree complete\n"
              << "  items:     " << PlatformUtils::formatNumber(stats.items) << "\n"
              << "  files:     " << PlatformUtils::formatNumber(stats.files)
              << " (" << PlatformUtils::abbrevSize(stats.bytes) << ")\n"
              << "  dirs:      " << PlatformUtils::formatNumber(stats.dirs) << "\n"
              << "  symlinks:  " << PlatformUtils::formatNumber(stats.symlinks) << "\n"
              << "  other:     " << PlatformUtils::formatNumber(stats.others) << "\n"
              << "  tokens:    " << PlatformUtils::formatNumber(static_cast<int64_t>(tree.tokenCount()))
              << " (" << PlatformUtils::formatNumber(static_cast<int64_t>(tree.ascendCount()))
              << " ascends)\n"
              << "  encoded:   " << PlatformUtils::abbrevSize(encodedBytes)
              << " vs " << PlatformUtils::abbrevSize(flatBytes) << " flat ("
              << PlatformUtils::formatPercent(encodedBytes, flatBytes) << ")\n"
              << "  built in   " << static_cast<int64_t>(seconds * 1000.0) << " ms" << std::endl;
}

void App::listPaths(const PathBuffer& tree) const {
    char sep = Config::instance().separator;
    for (const auto& components : tree) {
        std::cout << PathFormat::joinPath(tree.root(), components, sep) << '\n';
    }
    std::cout.flush();
}

bool App::verifyPaths(const PathBuffer& tree, const ScanStats& stats) const {
    int64_t count = 0;
    int64_t missing = 0;
    for (const auto& components : tree) {
        std::filesystem::path path = PathFormat::joinPath(tree.root(), components);
        std::error_code ec;
        std::filesystem::symlink_status(path, ec);
        if (ec) {
            std::cerr << "cptree: path stored in tree but missing from disk: "
                      << path.string() << std::endl;
            missing++;
        }
        count++;
    }

    if (count != stats.items) {
        std::cerr << "cptree: tree yields " << count << " paths, scan counted "
                  << stats.items << std::endl;
        return false;
    }
    return missing == 0;
}

} // namespace cptree
