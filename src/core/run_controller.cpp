#include "progviz/core/run_controller.hpp"
#include "progviz/common/error_codes.hpp"
#include "progviz/common/logger.hpp"
#include <cmath>
#include <utility>

namespace progviz {
namespace core {

namespace {

// Moves the cursor back to the caller position if a render is interrupted.
class CursorRestoreGuard {
public:
    CursorRestoreGuard(terminal::Terminal& terminal, const terminal::CursorPosition& target)
        : terminal_(terminal), target_(target) {}

    ~CursorRestoreGuard() {
        if (dismissed_) return;
        try {
            terminal_.write(terminal::escape::moveTo(target_));
            terminal_.flush();
        } catch (const std::exception& e) {
            common::Logger::instance().error("[Visualizer] Cursor restore failed | row={} | col={} | error={}",
                                             target_.row, target_.col, e.what());
        }
    }

    void dismiss() { dismissed_ = true; }

    CursorRestoreGuard(const CursorRestoreGuard&) = delete;
    CursorRestoreGuard& operator=(const CursorRestoreGuard&) = delete;

private:
    terminal::Terminal& terminal_;
    terminal::CursorPosition target_;
    bool dismissed_ = false;
};

}

void validateOptions(const VisualizeOptions& options) {
    if (!std::isfinite(options.throttle_interval_seconds) || options.throttle_interval_seconds < 0.0) {
        common::ErrorContext ctx;
        ctx.component = "Visualizer";
        ctx.details["throttle_interval"] = std::to_string(options.throttle_interval_seconds);
        throw common::ConfigError(common::VisualizerErrorCode::CONFIG_INVALID_THROTTLE, ctx);
    }
}

std::string to_string(RunPhase phase) {
    switch (phase) {
        case RunPhase::NOT_STARTED: return "not_started";
        case RunPhase::RUNNING: return "running";
        case RunPhase::COMPLETE: return "complete";
        case RunPhase::ABANDONED: return "abandoned";
    }
    return "unknown";
}

RunController::RunController(terminal::Terminal& terminal, render::ProgressRenderer renderer,
                             VisualizeOptions options, size_t total, Clock clock, bool& active_flag)
    : terminal_(terminal),
      renderer_(std::move(renderer)),
      options_(std::move(options)),
      total_(total),
      clock_(clock ? std::move(clock) : Clock([] { return std::chrono::steady_clock::now(); })),
      active_flag_(&active_flag) {
    validateOptions(options_);
}

void RunController::start() {
    if (*active_flag_) {
        throw common::SequenceError(common::VisualizerErrorCode::SESSION_ALREADY_ACTIVE);
    }
    *active_flag_ = true;
    holds_lease_ = true;

    state_ = RunState{};
    state_.start_time = clock_();

    if (total_ > 0) {
        try {
            state_.anchor = terminal_.queryCursorPosition();
        } catch (...) {
            releaseLease();
            throw;
        }
    }

    state_.phase = RunPhase::RUNNING;

    common::Logger::instance().debug("[Visualizer] Run started | description={} | total={} | anchor={};{} | throttle={}",
                                     options_.description, total_, state_.anchor.row, state_.anchor.col,
                                     options_.throttle_interval_seconds);
}

void RunController::step() {
    size_t next = state_.progress + 1;
    if (next > total_) {
        common::ErrorContext ctx;
        ctx.component = "Visualizer";
        ctx.details["total"] = std::to_string(total_);
        ctx.details["item"] = std::to_string(next);
        throw common::SequenceError(common::VisualizerErrorCode::SEQUENCE_EXCEEDS_TOTAL, ctx);
    }
    state_.progress = next;

    TimePoint now = clock_();
    if (shouldRender(next, now)) {
        renderProgress(next, now);
    }
}

void RunController::finish() {
    if (state_.phase != RunPhase::RUNNING) {
        return;
    }

    TimePoint now = clock_();

    // The closing line carries the run's full elapsed time, including the last item's work.
    bool stale = state_.renders == 0 || state_.last_rendered_progress != state_.progress;
    if (total_ > 0 && (stale || options_.track_time)) {
        if (state_.progress < total_) {
            common::Logger::instance().debug("[Visualizer] Sequence ended before total | progress={}/{}",
                                             state_.progress, total_);
        }
        renderProgress(state_.progress, now);
    }

    state_.end_time = now;
    state_.phase = RunPhase::COMPLETE;
    releaseLease();

    auto summary_now = summary();
    common::Logger::instance().debug("[Visualizer] Run complete | items={} | renders={} | elapsed_ms={}",
                                     summary_now.items, summary_now.renders, summary_now.elapsed.count());
}

void RunController::abandon() noexcept {
    if (state_.phase != RunPhase::RUNNING) {
        releaseLease();
        return;
    }

    state_.phase = RunPhase::ABANDONED;
    releaseLease();

    try {
        state_.end_time = clock_();
        terminal_.flush();
        common::Logger::instance().debug("[Visualizer] Run abandoned | progress={}/{} | renders={}",
                                         state_.progress, total_, state_.renders);
    } catch (const std::exception& e) {
        common::Logger::instance().error("[Visualizer] Cleanup after abandoned run failed | error={}", e.what());
    }
}

RunSummary RunController::summary() const {
    RunSummary summary;
    summary.items = state_.progress;
    summary.total = total_;
    summary.renders = state_.renders;
    summary.completed = state_.phase == RunPhase::COMPLETE;

    if (state_.phase != RunPhase::NOT_STARTED) {
        TimePoint end = state_.end_time ? *state_.end_time : clock_();
        summary.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(end - state_.start_time);
    }
    return summary;
}

bool RunController::shouldRender(size_t progress, TimePoint now) const {
    if (!state_.last_render_time || progress == total_) {
        return true;
    }
    std::chrono::duration<double> since_last = now - *state_.last_render_time;
    return since_last.count() >= options_.throttle_interval_seconds;
}

terminal::CursorPosition RunController::callerPosition() {
    if (state_.renders == 0) {
        return terminal::CursorPosition{state_.anchor.row + 1, state_.anchor.col};
    }
    return terminal_.queryCursorPosition();
}

void RunController::renderProgress(size_t progress, TimePoint now) {
    terminal::CursorPosition restore_to = callerPosition();

    render::ProgressSnapshot snapshot;
    snapshot.current = progress;
    snapshot.total = total_;
    snapshot.elapsed = now - state_.start_time;

    CursorRestoreGuard guard(terminal_, restore_to);

    terminal_.write(terminal::escape::moveTo(state_.anchor));
    terminal_.write(renderer_.renderLine(snapshot, options_.description, options_.track_time));
    terminal_.write(terminal::escape::moveTo(restore_to));
    terminal_.flush();
    guard.dismiss();

    state_.last_render_time = now;
    state_.last_rendered_progress = progress;
    ++state_.renders;
}

void RunController::releaseLease() noexcept {
    if (holds_lease_) {
        *active_flag_ = false;
        holds_lease_ = false;
    }
}

}}
