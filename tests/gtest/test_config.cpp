// =============================================================================
// Configuration & Logging Tests
// =============================================================================

#include <gtest/gtest.h>
#include "knowmap/config.hpp"
#include "knowmap/logging.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace knowmap;
namespace fs = std::filesystem;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        Config::getInstance().clear();
        unsetenv("KNOWMAP_MU");
        unsetenv("KNOWMAP_CLUSTERS");
        unsetenv("KNOWMAP_LOG_LEVEL");
        unsetenv("KNOWMAP_MAX_THREADS");
        file = fs::temp_directory_path() / "knowmap_config_test.conf";
    }

    void TearDown() override {
        Config::getInstance().clear();
        unsetenv("KNOWMAP_MU");
        unsetenv("KNOWMAP_CLUSTERS");
        unsetenv("KNOWMAP_LOG_LEVEL");
        unsetenv("KNOWMAP_MAX_THREADS");
        std::error_code ec;
        fs::remove(file, ec);
        set_log_level(LogLevel::INFO);
        set_log_output(std::cerr);
    }

    void write_file(const std::string& text) {
        std::ofstream out(file);
        out << text;
    }

    fs::path file;
};

TEST_F(ConfigTest, DefaultsWhenUnset) {
    Config& config = Config::getInstance();
    ASSERT_TRUE(config.load());
    EXPECT_DOUBLE_EQ(config.get<double>("flatten.mu", 0.75), 0.75);
    EXPECT_EQ(config.get<int>("flatten.clusters", 100), 100);
    EXPECT_FALSE(config.has("flatten.mu"));
}

TEST_F(ConfigTest, EnvironmentValues) {
    setenv("KNOWMAP_MU", "0.4", 1);
    setenv("KNOWMAP_CLUSTERS", "60", 1);

    Config& config = Config::getInstance();
    ASSERT_TRUE(config.load());
    EXPECT_DOUBLE_EQ(config.get<double>("flatten.mu", 0.75), 0.4);
    EXPECT_EQ(config.get<int>("flatten.clusters", 100), 60);
}

TEST_F(ConfigTest, FileOverridesEnvironment) {
    setenv("KNOWMAP_MU", "0.4", 1);
    write_file("# flattening\n"
               "flatten.mu = 0.9\n"
               "; comment\n"
               "flatten.seed=7\n"
               "not a setting\n"
               "flatten.greedy = yes\n");

    Config& config = Config::getInstance();
    ASSERT_TRUE(config.load(file.string()));
    EXPECT_DOUBLE_EQ(config.get<double>("flatten.mu", 0.75), 0.9);
    EXPECT_EQ(config.get<uint64_t>("flatten.seed", 42), 7u);
    EXPECT_TRUE(config.get<bool>("flatten.greedy", false));
}

TEST_F(ConfigTest, UnparsableValueFallsBackToDefault) {
    Config& config = Config::getInstance();
    config.set("flatten.clusters", "many");
    EXPECT_EQ(config.get<int>("flatten.clusters", 100), 100);
}

TEST_F(ConfigTest, NegativeThreadCountIsInvalid) {
    setenv("KNOWMAP_MAX_THREADS", "-2", 1);
    EXPECT_FALSE(Config::getInstance().load());
}

TEST_F(ConfigTest, UnknownLogLevelFallsBackToInfo) {
    setenv("KNOWMAP_LOG_LEVEL", "chatty", 1);
    ASSERT_TRUE(init_config());
    EXPECT_EQ(Config::getInstance().get<std::string>("log.level"), "info");
    EXPECT_EQ(Logger::getInstance().level(), LogLevel::INFO);
}

TEST_F(ConfigTest, LogLevelFromEnvironment) {
    setenv("KNOWMAP_LOG_LEVEL", "warn", 1);
    ASSERT_TRUE(init_config());
    EXPECT_EQ(Logger::getInstance().level(), LogLevel::WARN);
}

TEST_F(ConfigTest, LoggerFiltersByLevel) {
    std::ostringstream out;
    set_log_output(out);
    set_log_level(LogLevel::WARN);

    LOG_INFO("hidden ", 1);
    LOG_WARN("shown ", 2);

    const std::string text = out.str();
    EXPECT_EQ(text.find("hidden"), std::string::npos);
    EXPECT_NE(text.find("shown 2"), std::string::npos);
    EXPECT_NE(text.find("WARN"), std::string::npos);
}

TEST(LogLevelTest, Parse) {
    EXPECT_EQ(parse_log_level("debug"), LogLevel::DEBUG);
    EXPECT_EQ(parse_log_level("WARNING"), LogLevel::WARN);
    EXPECT_EQ(parse_log_level("error"), LogLevel::ERROR);
    EXPECT_EQ(parse_log_level("whatever"), LogLevel::INFO);
}

TEST_F(ConfigTest, NegativeUnsignedFallsBackToDefault) {
    Config& config = Config::getInstance();
    config.set("flatten.seed", "-1");
    config.set("flatten.subsample", " -5000");
    EXPECT_EQ(config.get<uint64_t>("flatten.seed", 42), 42u);
    EXPECT_EQ(config.get<uint64_t>("flatten.subsample", 5000), 5000u);

    config.set("flatten.seed", "7");
    EXPECT_EQ(config.get<uint64_t>("flatten.seed", 42), 7u);
}
