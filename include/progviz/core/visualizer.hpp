#pragma once

#include "progviz/common/constants.hpp"
#include "progviz/core/run_controller.hpp"
#include "progviz/core/visualized_sequence.hpp"
#include "progviz/render/progress_renderer.hpp"
#include "progviz/terminal/color.hpp"
#include "progviz/terminal/terminal.hpp"
#include <cstddef>
#include <iterator>
#include <string>
#include <type_traits>

namespace progviz {
namespace core {

namespace detail {

template<typename Range, typename = void>
struct has_size : std::false_type {};

template<typename Range>
struct has_size<Range, std::void_t<decltype(std::size(std::declval<Range&>()))>> : std::true_type {};

template<typename Range>
size_t rangeSize(Range& range) {
    if constexpr (has_size<Range>::value) {
        return static_cast<size_t>(std::size(range));
    } else {
        return static_cast<size_t>(std::distance(std::begin(range), std::end(range)));
    }
}

}

template<typename Range>
using RangeSequence = VisualizedSequence<decltype(std::begin(std::declval<Range&>())),
                                         decltype(std::end(std::declval<Range&>()))>;

// Renders a single-line progress bar while a sequence is iterated.
// The terminal must outlive the visualizer, and the visualizer every sequence it returns.
class ProgressVisualizer {
public:
    explicit ProgressVisualizer(terminal::Terminal& terminal,
                                int bar_length = constants::config_defaults::BAR_LENGTH,
                                terminal::ColorName done_color = terminal::ColorName::GREEN,
                                terminal::ColorName progress_color = terminal::ColorName::MAGENTA);

    ProgressVisualizer(terminal::Terminal& terminal, int bar_length,
                       const std::string& done_color, const std::string& progress_color);

    ProgressVisualizer(const ProgressVisualizer&) = delete;
    ProgressVisualizer& operator=(const ProgressVisualizer&) = delete;

    template<typename Range>
    RangeSequence<Range> visualize(Range& range,
                                   const std::string& description = constants::config_defaults::DESCRIPTION,
                                   const std::string& fill_char = constants::config_defaults::FILL_CHAR,
                                   bool track_time = constants::config_defaults::TRACK_TIME,
                                   double throttle_interval_seconds =
                                       constants::config_defaults::THROTTLE_INTERVAL_SECONDS) {
        VisualizeOptions options;
        options.description = description;
        options.fill_char = fill_char;
        options.track_time = track_time;
        options.throttle_interval_seconds = throttle_interval_seconds;
        return visualize(range, options);
    }

    template<typename Range>
    RangeSequence<Range> visualize(Range& range, const VisualizeOptions& options) {
        return RangeSequence<Range>(std::begin(range), std::end(range),
                                    makeController(options, detail::rangeSize(range)));
    }

    // For sources whose length is not discoverable up front.
    template<typename Iterator, typename Sentinel>
    VisualizedSequence<Iterator, Sentinel> visualizeStream(Iterator first, Sentinel last, size_t total,
                                                           const VisualizeOptions& options = {}) {
        return VisualizedSequence<Iterator, Sentinel>(std::move(first), std::move(last),
                                                      makeController(options, total));
    }

    // Temporaries would dangle before iteration finishes.
    template<typename Range, typename... Args>
    void visualize(const Range&&, Args&&...) = delete;

    void setClock(Clock clock) { clock_ = std::move(clock); }

    bool isRunning() const { return active_; }
    const render::BarConfig& barConfig() const { return bar_config_; }

private:
    terminal::Terminal& terminal_;
    render::BarConfig bar_config_;
    Clock clock_;
    bool active_ = false;

    RunController makeController(const VisualizeOptions& options, size_t total);
};

}}
