#pragma once

#include "progviz/common/constants.hpp"
#include "progviz/render/progress_renderer.hpp"
#include "progviz/terminal/terminal.hpp"
#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>

namespace progviz {
namespace core {

using TimePoint = std::chrono::steady_clock::time_point;
using Clock = std::function<TimePoint()>;

struct VisualizeOptions {
    std::string description = constants::config_defaults::DESCRIPTION;
    std::string fill_char = constants::config_defaults::FILL_CHAR;
    bool track_time = constants::config_defaults::TRACK_TIME;
    double throttle_interval_seconds = constants::config_defaults::THROTTLE_INTERVAL_SECONDS;
};

void validateOptions(const VisualizeOptions& options);

enum class RunPhase {
    NOT_STARTED,
    RUNNING,
    COMPLETE,
    ABANDONED
};

std::string to_string(RunPhase phase);

struct RunState {
    TimePoint start_time{};
    std::optional<TimePoint> last_render_time;
    std::optional<TimePoint> end_time;
    terminal::CursorPosition anchor;
    size_t progress = 0;
    size_t last_rendered_progress = 0;
    size_t renders = 0;
    RunPhase phase = RunPhase::NOT_STARTED;
};

struct RunSummary {
    size_t items = 0;
    size_t total = 0;
    size_t renders = 0;
    std::chrono::milliseconds elapsed{0};
    bool completed = false;
};

// Drives one visualize call: anchor capture, throttled renders and cursor restore.
// Holds references to the terminal and the owner's active-run flag; both must outlive it.
class RunController {
public:
    RunController(terminal::Terminal& terminal, render::ProgressRenderer renderer,
                  VisualizeOptions options, size_t total, Clock clock, bool& active_flag);

    void start();
    void step();
    void finish();
    void abandon() noexcept;

    RunPhase phase() const { return state_.phase; }
    size_t total() const { return total_; }
    const RunState& state() const { return state_; }
    const VisualizeOptions& options() const { return options_; }
    RunSummary summary() const;

private:
    terminal::Terminal& terminal_;
    render::ProgressRenderer renderer_;
    VisualizeOptions options_;
    size_t total_;
    Clock clock_;
    bool* active_flag_;
    bool holds_lease_ = false;
    RunState state_;

    bool shouldRender(size_t progress, TimePoint now) const;
    terminal::CursorPosition callerPosition();
    void renderProgress(size_t progress, TimePoint now);
    void releaseLease() noexcept;
};

}}
