#pragma once

#include <string>
#include <cstddef>

namespace progviz {
namespace constants {

namespace version {
    constexpr const char* VERSION = "1.0.0";

    inline std::string getFullVersion() {
        return std::string("progviz v") + VERSION;
    }
}

namespace system {
    constexpr const char* APPLICATION_NAME = "progviz";
    constexpr const char* LOGGER_NAME = "progviz";
    constexpr const char* CONFIG_ENV = "PROGVIZ_CONFIG";
    constexpr const char* CONFIG_DIR_NAME = "progviz";
    constexpr const char* CONFIG_FILE_NAME = "progviz.toml";
}

namespace limits {
    constexpr int DEFAULT_BAR_LENGTH = 50;
    constexpr double DEFAULT_THROTTLE_INTERVAL_SECONDS = 0.08;
    constexpr int DEFAULT_QUERY_TIMEOUT_MS = 100;
    constexpr int DEFAULT_QUERY_ATTEMPTS = 2;

    constexpr size_t DEFAULT_LOG_ROTATION_SIZE_MB = 10;
    constexpr size_t DEFAULT_LOG_MAX_FILES = 3;
}

namespace config_defaults {
    constexpr int BAR_LENGTH = limits::DEFAULT_BAR_LENGTH;
    constexpr const char* DONE_COLOR = "green";
    constexpr const char* PROGRESS_COLOR = "magenta";
    constexpr const char* FILL_CHAR = "=";

    constexpr const char* DESCRIPTION = "Progress";
    constexpr bool TRACK_TIME = true;
    constexpr double THROTTLE_INTERVAL_SECONDS = limits::DEFAULT_THROTTLE_INTERVAL_SECONDS;

    constexpr int QUERY_TIMEOUT_MS = limits::DEFAULT_QUERY_TIMEOUT_MS;
    constexpr int QUERY_ATTEMPTS = limits::DEFAULT_QUERY_ATTEMPTS;

    constexpr size_t LOG_ROTATION_SIZE_MB = limits::DEFAULT_LOG_ROTATION_SIZE_MB;
    constexpr size_t LOG_MAX_FILES = limits::DEFAULT_LOG_MAX_FILES;
}

}}
