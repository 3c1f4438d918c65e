#include <gtest/gtest.h>
#include "app/Config.h"

#include <filesystem>
#include <fstream>

using namespace cptree;

namespace {

namespace fs = std::filesystem;

class ConfigFixture : public ::testing::Test {
protected:
    void SetUp() override {
        tempDir = fs::temp_directory_path() / "cptree_test_config";
        fs::remove_all(tempDir);
        fs::create_directories(tempDir);
        Config::instance().resetDefaults();
    }

    void TearDown() override {
        Config::instance().resetDefaults();
        std::error_code ec;
        fs::remove_all(tempDir, ec);
    }

    fs::path tempDir;
};

} // namespace

TEST_F(ConfigFixture, Defaults) {
    const Config& config = Config::instance();
    EXPECT_TRUE(config.defaultRoot.empty());
    EXPECT_EQ(config.scan.maxDepth, 128);
    EXPECT_FALSE(config.scan.sortEntries);
    EXPECT_FALSE(config.showStats);
    EXPECT_EQ(config.separator, '/');
}

TEST_F(ConfigFixture, LoadFromFile) {
    fs::path file = tempDir / "config.json";
    std::ofstream(file) << R"({
        "defaultRoot": "/srv/data",
        "scan": { "maxDepth": 12, "sortEntries": true },
        "output": { "stats": true, "list": true, "separator": "\\" }
    })";

    Config& config = Config::instance();
    ASSERT_TRUE(config.loadFrom(file.string()));
    EXPECT_EQ(config.defaultRoot, "/srv/data");
    EXPECT_EQ(config.scan.maxDepth, 12);
    EXPECT_TRUE(config.scan.sortEntries);
    EXPECT_TRUE(config.showStats);
    EXPECT_TRUE(config.listPaths);
    EXPECT_FALSE(config.printEncoded);
    EXPECT_EQ(config.separator, '\\');
}

TEST_F(ConfigFixture, BadValuesKeepDefaults) {
    fs::path file = tempDir / "config.json";
    std::ofstream(file) << R"({
        "defaultRoot": 42,
        "scan": { "maxDepth": -3, "sortEntries": "yes" },
        "output": { "separator": "::" }
    })";

    Config& config = Config::instance();
    ASSERT_TRUE(config.loadFrom(file.string()));
    EXPECT_TRUE(config.defaultRoot.empty());
    EXPECT_EQ(config.scan.maxDepth, 128);
    EXPECT_FALSE(config.scan.sortEntries);
    EXPECT_EQ(config.separator, '/');
}

TEST_F(ConfigFixture, ParseErrorFallsBackToDefaults) {
    fs::path file = tempDir / "broken.json";
    std::ofstream(file) << "{ not json";

    Config& config = Config::instance();
    config.showStats = true;
    EXPECT_FALSE(config.loadFrom(file.string()));
    EXPECT_FALSE(config.showStats);
}

TEST_F(ConfigFixture, MissingFile) {
    EXPECT_FALSE(Config::instance().loadFrom((tempDir / "absent.json").string()));
}

TEST_F(ConfigFixture, SaveAndReload) {
    Config& config = Config::instance();
    config.defaultRoot = "/home/someone";
    config.scan.maxDepth = 7;
    config.verifyPaths = true;

    fs::path file = tempDir / "nested" / "dir" / "config.json";
    ASSERT_TRUE(config.saveTo(file.string()));

    config.resetDefaults();
    ASSERT_TRUE(config.loadFrom(file.string()));
    EXPECT_EQ(config.defaultRoot, "/home/someone");
    EXPECT_EQ(config.scan.maxDepth, 7);
    EXPECT_TRUE(config.verifyPaths);
    EXPECT_EQ(config.toJson()["output"]["separator"], "/");
}

TEST_F(ConfigFixture, MaxDepthOutOfIntRangeIsIgnored) {
    Config& config = Config::instance();

    config.fromJson(nlohmann::json::parse(R"({ "scan": { "maxDepth": 4294967297 } })"));
    EXPECT_EQ(config.scan.maxDepth, 128);

    config.fromJson(nlohmann::json::parse(R"({ "scan": { "maxDepth": 18446744073709551615 } })"));
    EXPECT_EQ(config.scan.maxDepth, 128);

    config.fromJson(nlohmann::json::parse(R"({ "scan": { "maxDepth": -4294967295 } })"));
    EXPECT_EQ(config.scan.maxDepth, 128);

    config.fromJson(nlohmann::json::parse(R"({ "scan": { "maxDepth": 2147483647 } })"));
    EXPECT_EQ(config.scan.maxDepth, 2147483647);
}
