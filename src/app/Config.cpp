#include "app/Config.h"

#include <algorithm>
#include <climits>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace cptree {

// ============================================================================
// Singleton accessor
// ============================================================================
Config& Config::instance() {
    static Config inst;
    return inst;
}

// ============================================================================
// getConfigPath - ~/.config/cptree/config.json or the XDG equivalent
// ============================================================================
std::string Config::getConfigPath() {
    const char* xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig && xdgConfig[0] != '\0') {
        return std::string(xdgConfig) + "/cptree/config.json";
    }
    const char* home = std::getenv("HOME");
    if (home) {
        return std::string(home) + "/.config/cptree/config.json";
    }
    return "cptree_config.json";
}

void Config::resetDefaults() {
    defaultRoot.clear();
    scan = ScanOptions();
    showStats = false;
    printEncoded = false;
    listPaths = false;
    verifyPaths = false;
    separator = '/';
}

// ============================================================================
// load / loadFrom
// ============================================================================
void Config::load() {
    std::string path = getConfigPath();
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        // File does not exist -- use defaults.
        return;
    }
    loadFrom(path);
}

bool Config::loadFrom(const std::string& path) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        std::cerr << "cptree: cannot open config " << path << std::endl;
        return false;
    }

    try {
        nlohmann::json j;
        ifs >> j;
        fromJson(j);
    } catch (const std::exception& e) {
        std::cerr << "cptree: failed to parse config: " << e.what() << std::endl;
        resetDefaults();
        return false;
    }
    return true;
}

// ============================================================================
// save - write JSON config to disk, creating directories if needed
// ============================================================================
void Config::save() {
    saveTo(getConfigPath());
}

bool Config::saveTo(const std::string& path) const {
    std::error_code ec;
    std::filesystem::path parent = std::filesystem::path(path).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            std::cerr << "cptree: cannot create " << parent.string() << ": "
                      << ec.message() << std::endl;
            return false;
        }
    }

    std::ofstream ofs(path);
    if (!ofs.is_open()) {
        std::cerr << "cptree: failed to write config to " << path << std::endl;
        return false;
    }

    ofs << toJson().dump(4) << std::endl;
    return true;
}

// ============================================================================
// toJson / fromJson
// ============================================================================
nlohmann::json Config::toJson() const {
    nlohmann::json j;

    j["defaultRoot"] = defaultRoot;

    j["scan"]["maxDepth"] = scan.maxDepth;
    j["scan"]["sortEntries"] = scan.sortEntries;

    nlohmann::json& jo = j["output"];
    jo["stats"] = showStats;
    jo["encoded"] = printEncoded;
    jo["list"] = listPaths;
    jo["verify"] = verifyPaths;
    jo["separator"] = std::string(1, separator);

    return j;
}

void Config::fromJson(const nlohmann::json& j) {
    // Start from defaults so that any missing key keeps its default.
    resetDefaults();

    if (j.contains("defaultRoot") && j["defaultRoot"].is_string()) {
        defaultRoot = j["defaultRoot"].get<std::string>();
    }

    if (j.contains("scan") && j["scan"].is_object()) {
        const auto& js = j["scan"];
        if (js.contains("maxDepth") && js["maxDepth"].is_number_integer()) {
            // Read wide so large values are rejected instead of wrapping.
            int64_t d = js["maxDepth"].is_number_unsigned()
                ? static_cast<int64_t>(std::min<uint64_t>(js["maxDepth"].get<uint64_t>(), INT64_MAX))
                : js["maxDepth"].get<int64_t>();
            if (d > 0 && d <= INT_MAX) {
                scan.maxDepth = static_cast<int>(d);
            }
        }
        if (js.contains("sortEntries") && js["sortEntries"].is_boolean()) {
            scan.sortEntries = js["sortEntries"].get<bool>();
        }
    }

    if (!j.contains("output") || !j["output"].is_object()) {
        return;
    }
    const auto& jo = j["output"];

    auto readFlag = [&jo](const char* key, bool& flag) {
        if (jo.contains(key) && jo[key].is_boolean()) {
            flag = jo[key].get<bool>();
        }
    };
    readFlag("stats", showStats);
    readFlag("encoded", printEncoded);
    readFlag("list", listPaths);
    readFlag("verify", verifyPaths);

    if (jo.contains("separator") && jo["separator"].is_string()) {
        std::string sep = jo["separator"].get<std::string>();
        if (sep.size() == 1) {
            separator = sep[0];
        }
    }
}

} // namespace cptree
