#pragma once

#include "progviz/common/constants.hpp"
#include "progviz/terminal/color.hpp"
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

namespace progviz {
namespace render {

struct BarConfig {
    int bar_length = constants::config_defaults::BAR_LENGTH;
    terminal::ColorName done_color = terminal::ColorName::GREEN;
    terminal::ColorName progress_color = terminal::ColorName::MAGENTA;
    std::string fill_char = constants::config_defaults::FILL_CHAR;
};

// Throws common::ConfigError when the bar length or fill character is unusable.
void validateBarConfig(const BarConfig& config);

struct ProgressSnapshot {
    size_t current = 0;
    size_t total = 1;
    std::chrono::duration<double> elapsed{0.0};

    bool isComplete() const { return current >= total; }
};

struct BarFill {
    size_t filled = 0;
    size_t pending = 0;
};

BarFill computeFill(int bar_length, size_t progress, size_t total);
double computePercentage(size_t progress, size_t total);

// Linear projection; empty until at least one item has completed.
std::optional<std::chrono::duration<double>> estimateRemaining(const ProgressSnapshot& snapshot);

class ProgressRenderer {
public:
    explicit ProgressRenderer(BarConfig config);

    std::string renderLine(const ProgressSnapshot& snapshot, const std::string& description,
                           bool show_time) const;

    std::string renderBar(const ProgressSnapshot& snapshot) const;
    std::string renderTimeField(const ProgressSnapshot& snapshot) const;

    terminal::ColorName barColor(const ProgressSnapshot& snapshot) const;
    terminal::ColorName textColor(const ProgressSnapshot& snapshot) const;

    const BarConfig& config() const { return config_; }

private:
    BarConfig config_;
};

}}
