#include "demo_command.hpp"
#include "progviz/common/config.hpp"
#include "progviz/common/logger.hpp"
#include "progviz/core/visualizer.hpp"
#include "progviz/format/summary_formatter.hpp"
#include "progviz/terminal/terminal.hpp"
#include <chrono>
#include <iostream>
#include <numeric>
#include <thread>
#include <vector>
#include <unistd.h>

namespace progviz {
namespace cli {

DemoCommand::DemoCommand() = default;

void DemoCommand::setup(CLI::App* subcommand) {
    subcommand_ = subcommand;

    subcommand->add_option("-n,--count", count_, "Number of items to iterate")
              ->check(CLI::PositiveNumber);
    subcommand->add_option("--delay-ms", delay_ms_, "Sleep per item in milliseconds")
              ->check(CLI::NonNegativeNumber);
    subcommand->add_option("--print-every", print_every_, "Print every Nth item below the bar (0 disables)");
    subcommand->add_option("--summary", summary_format_, "Summary after the run")
              ->check(CLI::IsMember({"none", "text", "json"}));

    bar_length_opt_ = subcommand->add_option("--bar-length", bar_length_, "Bar length in characters");
    done_color_opt_ = subcommand->add_option("--done-color", done_color_, "Bar color once complete");
    progress_color_opt_ = subcommand->add_option("--progress-color", progress_color_, "Bar color while running");
    fill_opt_ = subcommand->add_option("--fill", fill_char_, "Fill character (exactly one character)");
    description_opt_ = subcommand->add_option("-d,--description", description_, "Label printed before the bar");
    throttle_opt_ = subcommand->add_option("--throttle", throttle_, "Minimum seconds between redraws");
    subcommand->add_flag("--no-time", no_time_, "Hide the ETA and elapsed time field");

    markCalledOnParse();
}

void DemoCommand::applyOverrides(common::GlobalConfig& config) const {
    if (bar_length_opt_->count() > 0) config.bar.length = bar_length_;
    if (done_color_opt_->count() > 0) config.bar.done_color = done_color_;
    if (progress_color_opt_->count() > 0) config.bar.progress_color = progress_color_;
    if (fill_opt_->count() > 0) config.bar.fill_char = fill_char_;
    if (description_opt_->count() > 0) config.visualize.description = description_;
    if (throttle_opt_->count() > 0) config.visualize.throttle_interval = throttle_;
    if (no_time_) config.visualize.track_time = false;
}

int DemoCommand::execute() {
    common::GlobalConfig config = common::Config::instance().global();
    applyOverrides(config);

    terminal::PosixTerminalOptions terminal_options;
    terminal_options.input_fd = STDIN_FILENO;
    terminal_options.response_timeout = std::chrono::milliseconds(config.terminal.query_timeout_ms);
    terminal_options.query_attempts = config.terminal.query_attempts;

    terminal::PosixTerminal term(std::cout, terminal_options);
    if (!term.isInteractive() || !isatty(STDOUT_FILENO)) {
        std::cerr << "\033[31mError: the demo needs an interactive terminal on stdin and stdout\033[0m\n";
        return 1;
    }

    core::ProgressVisualizer visualizer(term, config.bar.length,
                                        config.bar.done_color, config.bar.progress_color);

    core::VisualizeOptions options;
    options.description = config.visualize.description;
    options.fill_char = config.bar.fill_char;
    options.track_time = config.visualize.track_time;
    options.throttle_interval_seconds = config.visualize.throttle_interval;

    std::vector<size_t> items(count_);
    std::iota(items.begin(), items.end(), size_t{0});

    common::Logger::instance().info("[Demo] Starting | count={} | delay_ms={} | print_every={}",
                                    count_, delay_ms_, print_every_);

    auto sequence = visualizer.visualize(items, options);
    for (const auto& item : sequence) {
        if (delay_ms_ > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms_));
        }
        if (print_every_ > 0 && item % print_every_ == 0) {
            std::cout << item << std::endl;
        }
    }

    std::cout << "Done!" << std::endl;

    auto summary_format = format::parseSummaryFormat(summary_format_).value_or(format::SummaryFormat::TEXT);
    if (summary_format != format::SummaryFormat::NONE) {
        std::cout << format::SummaryFormatter::format(sequence.summary(), summary_format) << std::endl;
    }

    return 0;
}

}}
