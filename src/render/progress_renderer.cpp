#include "progviz/render/progress_renderer.hpp"
#include "progviz/render/time_format.hpp"
#include "progviz/common/error_codes.hpp"
#include "progviz/common/text_utils.hpp"
#include "progviz/terminal/terminal.hpp"
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <cmath>
#include <utility>

namespace progviz {
namespace render {

void validateBarConfig(const BarConfig& config) {
    if (config.bar_length <= 0) {
        common::ErrorContext ctx;
        ctx.component = "Renderer";
        ctx.details["bar_length"] = std::to_string(config.bar_length);
        throw common::ConfigError(common::VisualizerErrorCode::CONFIG_INVALID_BAR_LENGTH, ctx);
    }

    if (!common::isSingleCharacter(config.fill_char)) {
        common::ErrorContext ctx;
        ctx.component = "Renderer";
        ctx.details["fill_char"] = config.fill_char;
        throw common::ConfigError(common::VisualizerErrorCode::CONFIG_INVALID_FILL_CHAR, ctx);
    }
}

BarFill computeFill(int bar_length, size_t progress, size_t total) {
    BarFill fill;
    size_t length = static_cast<size_t>(std::max(bar_length, 0));
    if (total == 0) {
        fill.pending = length;
        return fill;
    }

    unsigned long long scaled = static_cast<unsigned long long>(length) *
                                static_cast<unsigned long long>(std::min(progress, total));
    fill.filled = static_cast<size_t>(scaled / total);
    fill.pending = length - fill.filled;
    return fill;
}

double computePercentage(size_t progress, size_t total) {
    if (total == 0) {
        return 0.0;
    }
    double ratio = static_cast<double>(progress) / static_cast<double>(total);
    return std::round(ratio * 10000.0) / 100.0;
}

std::optional<std::chrono::duration<double>> estimateRemaining(const ProgressSnapshot& snapshot) {
    if (snapshot.current == 0 || snapshot.current >= snapshot.total) {
        return std::nullopt;
    }
    double remaining_items = static_cast<double>(snapshot.total - snapshot.current);
    return snapshot.elapsed * remaining_items / static_cast<double>(snapshot.current);
}

ProgressRenderer::ProgressRenderer(BarConfig config) : config_(std::move(config)) {
    validateBarConfig(config_);
}

terminal::ColorName ProgressRenderer::barColor(const ProgressSnapshot& snapshot) const {
    return snapshot.isComplete() ? config_.done_color : config_.progress_color;
}

terminal::ColorName ProgressRenderer::textColor(const ProgressSnapshot& snapshot) const {
    return snapshot.isComplete() ? config_.done_color : terminal::ColorName::RESET;
}

std::string ProgressRenderer::renderBar(const ProgressSnapshot& snapshot) const {
    BarFill fill = computeFill(config_.bar_length, snapshot.current, snapshot.total);
    std::string body = common::repeat(config_.fill_char, fill.filled) + std::string(fill.pending, ' ');
    return "[" + terminal::colorize(body, barColor(snapshot)) + "]";
}

std::string ProgressRenderer::renderTimeField(const ProgressSnapshot& snapshot) const {
    if (snapshot.isComplete()) {
        return "Elapsed: " + formatDuration(snapshot.elapsed);
    }

    auto eta = estimateRemaining(snapshot);
    if (!eta) {
        return "";
    }
    return "ETA: " + formatDuration(*eta);
}

std::string ProgressRenderer::renderLine(const ProgressSnapshot& snapshot, const std::string& description,
                                         bool show_time) const {
    terminal::ColorName text_color = textColor(snapshot);

    std::string percentage = fmt::format("{:.2f}%", computePercentage(snapshot.current, snapshot.total));
    std::string count = fmt::format("({}/{})", snapshot.current, snapshot.total);

    std::string line = terminal::escape::clearLine();
    line += description + ": ";
    line += renderBar(snapshot) + " ";
    line += terminal::colorize(percentage, text_color) + " ";
    line += terminal::colorize(count, text_color) + " ";

    if (show_time) {
        std::string time_field = renderTimeField(snapshot);
        if (!time_field.empty()) {
            line += terminal::colorize(time_field, text_color) + " ";
        }
    }

    line += terminal::escape::cursorToLineEnd();
    return line;
}

}}
