#include <gtest/gtest.h>
#include "core/ConfigManager.h"
#include <chrono>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

TEST(ConfigTest, DefaultsWhenEmpty) {
    Config cfg = Config::fromJson(nlohmann::json::object());
    EXPECT_EQ(cfg.logging.level, "info");
    EXPECT_TRUE(cfg.logging.file.empty());
    EXPECT_TRUE(cfg.logging.console);
    EXPECT_EQ(cfg.tools.timeoutSeconds, 180);
    EXPECT_TRUE(cfg.tools.dedupEnabled);
    EXPECT_EQ(cfg.agent.maxToolCallsPerTurn, 16u);
    EXPECT_FALSE(cfg.agent.systemPrompt.empty());
    EXPECT_EQ(cfg.agent.systemPrompt, Config::defaults().agent.systemPrompt);
}

TEST(ConfigTest, PartialOverrides) {
    auto j = nlohmann::json::parse(R"({
        "logging": {"level": "debug"},
        "tools": {"timeout_seconds": 5},
        "agent": {"max_tool_calls_per_turn": 3}
    })");
    Config cfg = Config::fromJson(j);
    EXPECT_EQ(cfg.logging.level, "debug");
    EXPECT_TRUE(cfg.logging.console);
    EXPECT_EQ(cfg.tools.timeoutSeconds, 5);
    EXPECT_TRUE(cfg.tools.dedupEnabled);
    EXPECT_EQ(cfg.agent.maxToolCallsPerTurn, 3u);
}

TEST(ConfigTest, WrongTypesNameTheKey) {
    try {
        Config::fromJson(nlohmann::json::parse(R"({"tools": {"dedup_enabled": "yes"}})"));
        FAIL() << "expected std::runtime_error";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("tools.dedup_enabled"), std::string::npos);
    }

    EXPECT_THROW(Config::fromJson(nlohmann::json::parse(R"({"logging": "verbose"})")), std::runtime_error);
    EXPECT_THROW(Config::fromJson(nlohmann::json::parse(R"({"agent": {"max_tool_calls_per_turn": -1}})")),
                 std::runtime_error);
    EXPECT_THROW(Config::fromJson(nlohmann::json::parse(R"({"tools": {"timeout_seconds": 0}})")), std::runtime_error);
    EXPECT_THROW(Config::fromJson(nlohmann::json::array()), std::runtime_error);
}

class ConfigFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto now = std::chrono::steady_clock::now().time_since_epoch().count();
        testDir = fs::temp_directory_path() / fs::path("quark_config_test_" + std::to_string(now));
        fs::create_directories(testDir);
    }

    void TearDown() override {
        fs::remove_all(testDir);
    }

    std::string writeFile(const std::string& name, const std::string& content) {
        auto path = (testDir / name).string();
        std::ofstream f(path);
        f << content;
        return path;
    }

    fs::path testDir;
};

TEST_F(ConfigFileTest, LoadsFromDisk) {
    auto path = writeFile("config.json", R"({"logging": {"file": "quark.log", "console": false}})");
    Config cfg = Config::load(path);
    EXPECT_EQ(cfg.logging.file, "quark.log");
    EXPECT_FALSE(cfg.logging.console);
}

TEST_F(ConfigFileTest, MissingFileAndBadJsonThrow) {
    EXPECT_THROW(Config::load((testDir / "absent.json").string()), std::runtime_error);

    auto path = writeFile("broken.json", "{ \"logging\": ");
    try {
        Config::load(path);
        FAIL() << "expected std::runtime_error";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("JSON Parse Error"), std::string::npos);
    }
}
