#include "progviz/terminal/color.hpp"
#include "progviz/common/error_codes.hpp"

namespace progviz {
namespace terminal {

std::optional<ColorName> parseColorName(const std::string& name) {
    for (auto color : ALL_COLORS) {
        if (to_string(color) == name) {
            return color;
        }
    }
    return std::nullopt;
}

ColorName colorFromString(const std::string& name) {
    auto color = parseColorName(name);
    if (!color) {
        common::ErrorContext ctx;
        ctx.component = "Color";
        ctx.details["color"] = name;
        throw common::ConfigError(common::VisualizerErrorCode::CONFIG_INVALID_COLOR,
                                  "Unsupported color: " + name, ctx);
    }
    return *color;
}

const char* colorCode(ColorName color) {
    switch (color) {
        case ColorName::BLACK: return "\033[30m";
        case ColorName::RED: return "\033[31m";
        case ColorName::GREEN: return "\033[32m";
        case ColorName::YELLOW: return "\033[33m";
        case ColorName::BLUE: return "\033[34m";
        case ColorName::MAGENTA: return "\033[35m";
        case ColorName::CYAN: return "\033[36m";
        case ColorName::WHITE: return "\033[37m";
        case ColorName::PINK: return "\033[95m";
        case ColorName::RESET: return "\033[0m";
    }
    return "\033[0m";
}

std::string colorize(const std::string& text, ColorName color) {
    return std::string(colorCode(color)) + text + colorCode(ColorName::RESET);
}

std::string to_string(ColorName color) {
    switch (color) {
        case ColorName::BLACK: return "black";
        case ColorName::RED: return "red";
        case ColorName::GREEN: return "green";
        case ColorName::YELLOW: return "yellow";
        case ColorName::BLUE: return "blue";
        case ColorName::MAGENTA: return "magenta";
        case ColorName::CYAN: return "cyan";
        case ColorName::WHITE: return "white";
        case ColorName::PINK: return "pink";
        case ColorName::RESET: return "reset";
    }
    return "reset";
}

}}
