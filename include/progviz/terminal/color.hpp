#pragma once

#include <array>
#include <optional>
#include <string>

namespace progviz {
namespace terminal {

enum class ColorName {
    BLACK,
    RED,
    GREEN,
    YELLOW,
    BLUE,
    MAGENTA,
    CYAN,
    WHITE,
    PINK,
    RESET
};

constexpr std::array<ColorName, 10> ALL_COLORS = {
    ColorName::BLACK, ColorName::RED, ColorName::GREEN, ColorName::YELLOW, ColorName::BLUE,
    ColorName::MAGENTA, ColorName::CYAN, ColorName::WHITE, ColorName::PINK, ColorName::RESET
};

std::optional<ColorName> parseColorName(const std::string& name);

// Throws common::ConfigError (CONFIG_INVALID_COLOR) for names outside the table.
ColorName colorFromString(const std::string& name);

const char* colorCode(ColorName color);

std::string colorize(const std::string& text, ColorName color);

std::string to_string(ColorName color);

}}
