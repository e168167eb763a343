#include <gtest/gtest.h>
#include "castle_config.hpp"
#include "castle_logger.hpp"

#include <cstdio>
#include <fstream>
#include <regex>
#include <sstream>

using castle::Config;
using castle::LogLevel;
using castle::Logger;

TEST(ConfigTest, Defaults) {
    Config cfg;
    EXPECT_EQ(cfg.get("log.level"), "info");
    EXPECT_TRUE(cfg.getBool("log.console"));
    EXPECT_EQ(cfg.get("profile.name"), "chrome_windows");
}

TEST(ConfigTest, TypedGetters) {
    Config cfg;
    cfg.set("a", "42");
    cfg.set("b", "1.25");
    cfg.set("c", "Yes");
    cfg.set("d", "not-a-number");
    EXPECT_EQ(cfg.getInt("a"), 42);
    EXPECT_DOUBLE_EQ(cfg.getDouble("b"), 1.25);
    EXPECT_TRUE(cfg.getBool("c"));
    EXPECT_EQ(cfg.getInt("d", 7), 7);
    EXPECT_EQ(cfg.getInt("missing", 3), 3);
}

TEST(ConfigTest, LoadFromFile) {
    const std::string path = ::testing::TempDir() + "castle_config_test.conf";
    {
        std::ofstream f(path);
        f << "# comment\n"
          << "; another\n"
          << "profile.name = chrome_windows_1440p\n"
          << "  profile.locale=de-DE  \n"
          << "   # indented comment = ignored\n"
          << "garbage line\n";
    }

    Config cfg;
    ASSERT_TRUE(cfg.loadFromFile(path));
    EXPECT_EQ(cfg.get("profile.name"), "chrome_windows_1440p");
    EXPECT_EQ(cfg.get("profile.locale"), "de-DE");
    EXPECT_EQ(cfg.get("garbage line", "absent"), "absent");
    EXPECT_EQ(cfg.get("# indented comment", "absent"), "absent");
    std::remove(path.c_str());
}

TEST(ConfigTest, MissingFile) {
    Config cfg;
    EXPECT_FALSE(cfg.loadFromFile("/nonexistent/castle.conf"));
}

TEST(LoggerTest, LevelFromString) {
    EXPECT_EQ(Logger::levelFromString("trace"), LogLevel::TRACE);
    EXPECT_EQ(Logger::levelFromString("warning"), LogLevel::WARN);
    EXPECT_EQ(Logger::levelFromString("none"), LogLevel::NONE);
    EXPECT_EQ(Logger::levelFromString("bogus"), LogLevel::INFO);
}

TEST(LoggerTest, FileOutputHonoursLevel) {
    const std::string path = ::testing::TempDir() + "castle_logger_test.log";
    std::remove(path.c_str());

    auto& logger = Logger::instance();
    logger.setConsoleOutput(false);
    logger.setLevel(LogLevel::WARN);
    ASSERT_TRUE(logger.setFileOutput(path));

    CASTLE_LOG_DEBUG("below threshold");
    CASTLE_LOG_WARN("timezone fallback");

    logger.setLevel(LogLevel::INFO);
    logger.setConsoleOutput(true);

    std::ifstream in(path);
    std::stringstream content;
    content << in.rdbuf();
    const std::string text = content.str();

    EXPECT_EQ(text.find("below threshold"), std::string::npos);
    EXPECT_TRUE(std::regex_search(text, std::regex(
        R"(\d{4}-\d{2}-\d{2} \d{2}:\d{2}:\d{2}\.\d{3} \[WARN \] timezone fallback)")));
}
