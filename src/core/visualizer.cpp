#include "progviz/core/visualizer.hpp"
#include "progviz/common/logger.hpp"

namespace progviz {
namespace core {

ProgressVisualizer::ProgressVisualizer(terminal::Terminal& terminal, int bar_length,
                                       terminal::ColorName done_color, terminal::ColorName progress_color)
    : terminal_(terminal) {
    bar_config_.bar_length = bar_length;
    bar_config_.done_color = done_color;
    bar_config_.progress_color = progress_color;
    render::validateBarConfig(bar_config_);
}

ProgressVisualizer::ProgressVisualizer(terminal::Terminal& terminal, int bar_length,
                                       const std::string& done_color, const std::string& progress_color)
    : ProgressVisualizer(terminal, bar_length,
                         terminal::colorFromString(done_color),
                         terminal::colorFromString(progress_color)) {
}

RunController ProgressVisualizer::makeController(const VisualizeOptions& options, size_t total) {
    render::BarConfig config = bar_config_;
    config.fill_char = options.fill_char;

    common::Logger::instance().debug("[Visualizer] Preparing run | total={} | fill={} | track_time={}",
                                     total, options.fill_char, options.track_time);

    return RunController(terminal_, render::ProgressRenderer(config), options, total, clock_, active_);
}

}}
