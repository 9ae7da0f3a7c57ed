#include "progviz/common/config.hpp"
#include "progviz/common/constants.hpp"
#include "progviz/common/logger.hpp"
#include <toml.hpp>
#include <cstdlib>
#include <filesystem>
#include <unistd.h>

namespace progviz {
namespace common {

static double readSeconds(const toml::value& section, const std::string& key) {
    const auto& value = toml::find(section, key);
    if (value.is_integer()) {
        return static_cast<double>(value.as_integer());
    }
    return toml::get<double>(value);
}

Config& Config::instance() {
    static Config instance;
    return instance;
}

Config::Config() {
    global_ = createDefaultConfig();
}

GlobalConfig Config::createDefaultConfig() {
    using namespace constants::config_defaults;

    GlobalConfig config;

    config.bar.length = BAR_LENGTH;
    config.bar.done_color = DONE_COLOR;
    config.bar.progress_color = PROGRESS_COLOR;
    config.bar.fill_char = FILL_CHAR;

    config.visualize.description = DESCRIPTION;
    config.visualize.track_time = TRACK_TIME;
    config.visualize.throttle_interval = THROTTLE_INTERVAL_SECONDS;

    config.terminal.query_timeout_ms = QUERY_TIMEOUT_MS;
    config.terminal.query_attempts = QUERY_ATTEMPTS;

    config.logging.level = LogLevel::WARN;
    config.logging.log_file = "";
    config.logging.format = LogFormat::TEXT;
    config.logging.rotation_size_mb = LOG_ROTATION_SIZE_MB;
    config.logging.max_files = LOG_MAX_FILES;

    return config;
}

std::optional<LogLevel> Config::parseLogLevel(const std::string& level) {
    if (level == "DEBUG") return LogLevel::DEBUG;
    if (level == "INFO") return LogLevel::INFO;
    if (level == "WARN") return LogLevel::WARN;
    if (level == "ERROR") return LogLevel::ERROR;
    return std::nullopt;
}

void Config::reset() {
    global_ = createDefaultConfig();
    current_config_path_.clear();
}

std::vector<std::string> Config::getConfigSearchPaths() const {
    std::vector<std::string> paths;

    if (const char* env_path = std::getenv(constants::system::CONFIG_ENV)) {
        if (*env_path) {
            paths.emplace_back(env_path);
        }
    }

    std::filesystem::path relative =
        std::filesystem::path(constants::system::CONFIG_DIR_NAME) / constants::system::CONFIG_FILE_NAME;

    if (const char* xdg = std::getenv("XDG_CONFIG_HOME")) {
        if (*xdg) {
            paths.push_back((std::filesystem::path(xdg) / relative).string());
        }
    }

    if (const char* home = std::getenv("HOME")) {
        if (*home) {
            paths.push_back((std::filesystem::path(home) / ".config" / relative).string());
        }
    }

    return paths;
}

std::optional<std::string> Config::findBestConfig() const {
    for (const auto& path : getConfigSearchPaths()) {
        if (std::filesystem::exists(path) && access(path.c_str(), R_OK) == 0) {
            return path;
        }
    }

    return std::nullopt;
}

bool Config::load(const std::string& config_file) {
    global_ = createDefaultConfig();

    std::string effective_config_file = config_file;
    if (effective_config_file.empty()) {
        auto best = findBestConfig();
        if (!best) {
            Logger::instance().debug("[Config] No configuration file found, using defaults");
            current_config_path_.clear();
            return true;
        }
        effective_config_file = *best;
    }

    current_config_path_ = effective_config_file;
    return tryLoadTomlFile(effective_config_file);
}

bool Config::tryLoadTomlFile(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        Logger::instance().warn("[Config] Not found | path={}", path);
        return false;
    }

    if (access(path.c_str(), R_OK) != 0) {
        Logger::instance().warn("[Config] Not readable | path={}", path);
        return false;
    }

    GlobalConfig loaded = global_;

    try {
        auto data = toml::parse(path);

        if (data.contains("bar")) {
            const auto& bar_section = data.at("bar");

            if (bar_section.contains("length")) {
                loaded.bar.length = toml::find<int>(bar_section, "length");
            }
            if (bar_section.contains("done_color")) {
                loaded.bar.done_color = toml::find<std::string>(bar_section, "done_color");
            }
            if (bar_section.contains("progress_color")) {
                loaded.bar.progress_color = toml::find<std::string>(bar_section, "progress_color");
            }
            if (bar_section.contains("fill_char")) {
                loaded.bar.fill_char = toml::find<std::string>(bar_section, "fill_char");
            }
        }

        if (data.contains("visualize")) {
            const auto& visualize_section = data.at("visualize");

            if (visualize_section.contains("description")) {
                loaded.visualize.description = toml::find<std::string>(visualize_section, "description");
            }
            if (visualize_section.contains("track_time")) {
                loaded.visualize.track_time = toml::find<bool>(visualize_section, "track_time");
            }
            if (visualize_section.contains("throttle_interval")) {
                loaded.visualize.throttle_interval = readSeconds(visualize_section, "throttle_interval");
            }
        }

        if (data.contains("terminal")) {
            const auto& terminal_section = data.at("terminal");

            if (terminal_section.contains("query_timeout_ms")) {
                loaded.terminal.query_timeout_ms = toml::find<int>(terminal_section, "query_timeout_ms");
            }
            if (terminal_section.contains("query_attempts")) {
                loaded.terminal.query_attempts = toml::find<int>(terminal_section, "query_attempts");
            }
        }

        if (data.contains("logging")) {
            const auto& logging_section = data.at("logging");

            if (logging_section.contains("level")) {
                std::string level = toml::find<std::string>(logging_section, "level");
                if (auto parsed = parseLogLevel(level)) {
                    loaded.logging.level = *parsed;
                } else {
                    Logger::instance().warn("[Config] Unknown log level ignored | level={}", level);
                }
            }
            if (logging_section.contains("file")) {
                loaded.logging.log_file = toml::find<std::string>(logging_section, "file");
            }
            if (logging_section.contains("format")) {
                std::string format_str = toml::find<std::string>(logging_section, "format");
                loaded.logging.format = (format_str == "json") ? LogFormat::JSON : LogFormat::TEXT;
            }
            if (logging_section.contains("rotation_size_mb")) {
                loaded.logging.rotation_size_mb = toml::find<size_t>(logging_section, "rotation_size_mb");
            }
            if (logging_section.contains("max_files")) {
                loaded.logging.max_files = toml::find<size_t>(logging_section, "max_files");
            }
        }
    } catch (const std::exception& e) {
        Logger::instance().warn("[Config] Parse failed | path={} | error={}", path, e.what());
        return false;
    }

    global_ = loaded;
    Logger::instance().info("[Config] Loaded | path={}", path);
    return true;
}

}}
