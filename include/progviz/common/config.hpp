#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstddef>

namespace progviz {
namespace common {

enum class LogLevel {
    ERROR = 0,
    WARN = 1,
    INFO = 2,
    DEBUG = 3
};

enum class LogFormat {
    TEXT,
    JSON
};

struct BarSettings {
    int length;
    std::string done_color;
    std::string progress_color;
    std::string fill_char;
};

struct VisualizeSettings {
    std::string description;
    bool track_time;
    double throttle_interval;
};

struct TerminalSettings {
    int query_timeout_ms;
    int query_attempts;
};

struct LoggingConfig {
    LogLevel level;
    std::string log_file;
    LogFormat format;
    size_t rotation_size_mb;
    size_t max_files;
};

struct GlobalConfig {
    BarSettings bar;
    VisualizeSettings visualize;
    TerminalSettings terminal;
    LoggingConfig logging;
};

class Config {
public:
    static Config& instance();

    bool load(const std::string& config_file = "");
    void reset();

    const GlobalConfig& global() const { return global_; }
    GlobalConfig& global() { return global_; }

    std::optional<std::string> findBestConfig() const;
    std::vector<std::string> getConfigSearchPaths() const;
    const std::string& getConfigPath() const { return current_config_path_; }

    static GlobalConfig createDefaultConfig();
    static std::optional<LogLevel> parseLogLevel(const std::string& level);

private:
    Config();
    GlobalConfig global_;
    std::string current_config_path_;

    bool tryLoadTomlFile(const std::string& path);
};

}}
