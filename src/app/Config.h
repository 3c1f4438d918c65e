#pragma once

#include "core/TreeScanner.h"

#include <string>
#include <nlohmann/json.hpp>

namespace cptree {

class Config {
public:
    static Config& instance();

    // Load from getConfigPath(); defaults are kept if the file is missing.
    void load();

    // Load from an explicit file. Returns false if it could not be opened
    // or parsed (defaults are kept in that case).
    bool loadFrom(const std::string& path);

    void save();
    bool saveTo(const std::string& path) const;

    // Restore built-in defaults.
    void resetDefaults();

    // Scan settings
    std::string defaultRoot;
    ScanOptions scan;

    // Output settings
    bool showStats = false;
    bool printEncoded = false;
    bool listPaths = false;
    bool verifyPaths = false;
    char separator = '/';

    // Get config file path
    static std::string getConfigPath();

    nlohmann::json toJson() const;
    void fromJson(const nlohmann::json& j);

private:
    Config() = default;
};

} // namespace cptree
