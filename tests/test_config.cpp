#include "progviz/common/config.hpp"
#include "progviz/common/constants.hpp"
#include "progviz/common/error_codes.hpp"
#include "progviz/core/visualizer.hpp"
#include "fake_terminal.hpp"
#include <gtest/gtest.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

using namespace progviz;
using common::Config;

namespace fs = std::filesystem;

class ConfigTest : public ::testing::Test {
protected:
    fs::path dir_;

    void SetUp() override {
        dir_ = fs::temp_directory_path() / ("progviz_config_test_" + std::to_string(getpid()));
        fs::create_directories(dir_);
        unsetenv(constants::system::CONFIG_ENV);
        Config::instance().reset();
    }

    void TearDown() override {
        unsetenv(constants::system::CONFIG_ENV);
        Config::instance().reset();
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    std::string writeFile(const std::string& name, const std::string& content) {
        fs::path path = dir_ / name;
        std::ofstream out(path);
        out << content;
        return path.string();
    }
};

TEST_F(ConfigTest, DefaultsMatchLibraryDefaults) {
    const auto& config = Config::instance().global();
    EXPECT_EQ(config.bar.length, 50);
    EXPECT_EQ(config.bar.done_color, "green");
    EXPECT_EQ(config.bar.progress_color, "magenta");
    EXPECT_EQ(config.bar.fill_char, "=");
    EXPECT_EQ(config.visualize.description, "Progress");
    EXPECT_TRUE(config.visualize.track_time);
    EXPECT_DOUBLE_EQ(config.visualize.throttle_interval, 0.08);
    EXPECT_EQ(config.logging.level, common::LogLevel::WARN);
    EXPECT_TRUE(config.logging.log_file.empty());
}

TEST_F(ConfigTest, FileOverridesOnlyWhatItNames) {
    auto path = writeFile("progviz.toml",
                          "[bar]\n"
                          "length = 20\n"
                          "done_color = \"cyan\"\n"
                          "fill_char = \"#\"\n"
                          "\n"
                          "[visualize]\n"
                          "description = \"Copying\"\n"
                          "throttle_interval = 1\n"
                          "\n"
                          "[terminal]\n"
                          "query_attempts = 4\n"
                          "\n"
                          "[logging]\n"
                          "level = \"DEBUG\"\n"
                          "format = \"json\"\n");

    ASSERT_TRUE(Config::instance().load(path));
    EXPECT_EQ(Config::instance().getConfigPath(), path);

    const auto& config = Config::instance().global();
    EXPECT_EQ(config.bar.length, 20);
    EXPECT_EQ(config.bar.done_color, "cyan");
    EXPECT_EQ(config.bar.progress_color, "magenta");
    EXPECT_EQ(config.bar.fill_char, "#");
    EXPECT_EQ(config.visualize.description, "Copying");
    EXPECT_TRUE(config.visualize.track_time);
    EXPECT_DOUBLE_EQ(config.visualize.throttle_interval, 1.0);
    EXPECT_EQ(config.terminal.query_attempts, 4);
    EXPECT_EQ(config.terminal.query_timeout_ms, 100);
    EXPECT_EQ(config.logging.level, common::LogLevel::DEBUG);
    EXPECT_EQ(config.logging.format, common::LogFormat::JSON);
}

TEST_F(ConfigTest, FractionalThrottle) {
    auto path = writeFile("throttle.toml", "[visualize]\nthrottle_interval = 0.25\ntrack_time = false\n");
    ASSERT_TRUE(Config::instance().load(path));
    EXPECT_DOUBLE_EQ(Config::instance().global().visualize.throttle_interval, 0.25);
    EXPECT_FALSE(Config::instance().global().visualize.track_time);
}

TEST_F(ConfigTest, MalformedFileKeepsDefaults) {
    auto path = writeFile("broken.toml", "[bar\nlength = = 3\n");
    EXPECT_FALSE(Config::instance().load(path));
    EXPECT_EQ(Config::instance().global().bar.length, 50);
}

TEST_F(ConfigTest, WrongValueTypeKeepsDefaults) {
    auto path = writeFile("typed.toml", "[bar]\nlength = \"wide\"\ndone_color = \"red\"\n");
    EXPECT_FALSE(Config::instance().load(path));
    EXPECT_EQ(Config::instance().global().bar.length, 50);
    EXPECT_EQ(Config::instance().global().bar.done_color, "green");
}

TEST_F(ConfigTest, MissingExplicitFileFails) {
    EXPECT_FALSE(Config::instance().load((dir_ / "absent.toml").string()));
    EXPECT_EQ(Config::instance().global().bar.length, 50);
}

TEST_F(ConfigTest, UnknownLogLevelIsIgnored) {
    auto path = writeFile("level.toml", "[logging]\nlevel = \"LOUD\"\n");
    ASSERT_TRUE(Config::instance().load(path));
    EXPECT_EQ(Config::instance().global().logging.level, common::LogLevel::WARN);
    EXPECT_FALSE(Config::parseLogLevel("LOUD").has_value());
    EXPECT_TRUE(Config::parseLogLevel("INFO") == common::LogLevel::INFO);
}

TEST_F(ConfigTest, EnvironmentVariableComesFirstInSearch) {
    auto path = writeFile("env.toml", "[bar]\nlength = 33\n");
    setenv(constants::system::CONFIG_ENV, path.c_str(), 1);

    auto paths = Config::instance().getConfigSearchPaths();
    ASSERT_FALSE(paths.empty());
    EXPECT_EQ(paths.front(), path);

    auto best = Config::instance().findBestConfig();
    ASSERT_TRUE(best.has_value());
    EXPECT_EQ(*best, path);

    ASSERT_TRUE(Config::instance().load());
    EXPECT_EQ(Config::instance().global().bar.length, 33);
}

TEST_F(ConfigTest, ConfiguredColorsAreValidatedByVisualizer) {
    auto path = writeFile("colors.toml", "[bar]\nprogress_color = \"purple\"\n");
    ASSERT_TRUE(Config::instance().load(path));

    const auto& bar = Config::instance().global().bar;
    fakes::FakeTerminal term;
    try {
        core::ProgressVisualizer visualizer(term, bar.length, bar.done_color, bar.progress_color);
        FAIL() << "expected ConfigError";
    } catch (const common::ConfigError& e) {
        EXPECT_EQ(e.code(), common::VisualizerErrorCode::CONFIG_INVALID_COLOR);
        EXPECT_EQ(e.context().details.at("color"), "purple");
    }
    EXPECT_TRUE(term.writes.empty());
}
