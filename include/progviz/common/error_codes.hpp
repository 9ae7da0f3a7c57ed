#pragma once

#include "error_framework.hpp"
#include <stdexcept>
#include <string>
#include <unordered_map>

namespace progviz {
namespace common {

enum class VisualizerErrorCode {
    CONFIG_INVALID_COLOR = 100,
    CONFIG_INVALID_FILL_CHAR = 101,
    CONFIG_INVALID_BAR_LENGTH = 102,
    CONFIG_INVALID_THROTTLE = 103,

    TERMINAL_NOT_INTERACTIVE = 200,
    TERMINAL_QUERY_FAILED = 201,
    TERMINAL_RESPONSE_MALFORMED = 202,
    TERMINAL_WRITE_FAILED = 203,

    SEQUENCE_EXCEEDS_TOTAL = 300,
    SEQUENCE_ALREADY_CONSUMED = 301,
    SESSION_ALREADY_ACTIVE = 302
};

using VisualizerErrorCodeHelper = ErrorRegistry<VisualizerErrorCode>;

template<>
inline const std::unordered_map<VisualizerErrorCode, ErrorInfo<VisualizerErrorCode>>&
ErrorRegistry<VisualizerErrorCode>::getInfoMap() {
    static const std::unordered_map<VisualizerErrorCode, ErrorInfo<VisualizerErrorCode>> map = {
        {VisualizerErrorCode::CONFIG_INVALID_COLOR, {
            VisualizerErrorCode::CONFIG_INVALID_COLOR,
            "CONFIG_INVALID_COLOR",
            "Unsupported color"
        }},
        {VisualizerErrorCode::CONFIG_INVALID_FILL_CHAR, {
            VisualizerErrorCode::CONFIG_INVALID_FILL_CHAR,
            "CONFIG_INVALID_FILL_CHAR",
            "The fill character must be a single character"
        }},
        {VisualizerErrorCode::CONFIG_INVALID_BAR_LENGTH, {
            VisualizerErrorCode::CONFIG_INVALID_BAR_LENGTH,
            "CONFIG_INVALID_BAR_LENGTH",
            "Bar length must be positive"
        }},
        {VisualizerErrorCode::CONFIG_INVALID_THROTTLE, {
            VisualizerErrorCode::CONFIG_INVALID_THROTTLE,
            "CONFIG_INVALID_THROTTLE",
            "Throttle interval must be a non-negative number of seconds"
        }},
        {VisualizerErrorCode::TERMINAL_NOT_INTERACTIVE, {
            VisualizerErrorCode::TERMINAL_NOT_INTERACTIVE,
            "TERMINAL_NOT_INTERACTIVE",
            "Cursor position can only be queried on an interactive terminal"
        }},
        {VisualizerErrorCode::TERMINAL_QUERY_FAILED, {
            VisualizerErrorCode::TERMINAL_QUERY_FAILED,
            "TERMINAL_QUERY_FAILED",
            "Terminal did not answer the cursor position query"
        }},
        {VisualizerErrorCode::TERMINAL_RESPONSE_MALFORMED, {
            VisualizerErrorCode::TERMINAL_RESPONSE_MALFORMED,
            "TERMINAL_RESPONSE_MALFORMED",
            "Malformed cursor position report"
        }},
        {VisualizerErrorCode::TERMINAL_WRITE_FAILED, {
            VisualizerErrorCode::TERMINAL_WRITE_FAILED,
            "TERMINAL_WRITE_FAILED",
            "Failed to write to the terminal"
        }},
        {VisualizerErrorCode::SEQUENCE_EXCEEDS_TOTAL, {
            VisualizerErrorCode::SEQUENCE_EXCEEDS_TOTAL,
            "SEQUENCE_EXCEEDS_TOTAL",
            "Sequence produced more items than its declared total"
        }},
        {VisualizerErrorCode::SEQUENCE_ALREADY_CONSUMED, {
            VisualizerErrorCode::SEQUENCE_ALREADY_CONSUMED,
            "SEQUENCE_ALREADY_CONSUMED",
            "Visualized sequence is single-pass and was already iterated"
        }},
        {VisualizerErrorCode::SESSION_ALREADY_ACTIVE, {
            VisualizerErrorCode::SESSION_ALREADY_ACTIVE,
            "SESSION_ALREADY_ACTIVE",
            "Another visualization is already running on this visualizer"
        }}
    };
    return map;
}

class VisualizerError : public std::runtime_error {
public:
    VisualizerError(VisualizerErrorCode code, const std::string& message, ErrorContext context = {});
    explicit VisualizerError(VisualizerErrorCode code, ErrorContext context = {});

    VisualizerErrorCode code() const { return code_; }
    const ErrorContext& context() const { return context_; }
    const char* codeString() const { return VisualizerErrorCodeHelper::toString(code_); }

private:
    VisualizerErrorCode code_;
    ErrorContext context_;
};

class ConfigError : public VisualizerError {
public:
    using VisualizerError::VisualizerError;
};

class TerminalError : public VisualizerError {
public:
    using VisualizerError::VisualizerError;
};

class SequenceError : public VisualizerError {
public:
    using VisualizerError::VisualizerError;
};

}}
