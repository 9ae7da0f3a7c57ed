#pragma once

#include "main_command.hpp"
#include "progviz/common/config.hpp"
#include <CLI/CLI.hpp>
#include <cstddef>
#include <string>

namespace progviz {
namespace cli {

class DemoCommand : public MainCommand {
public:
    DemoCommand();

    void setup(CLI::App* subcommand) override;
    int execute() override;

private:
    size_t count_ = 10001;
    int delay_ms_ = 0;
    size_t print_every_ = 1000;
    std::string summary_format_ = "text";

    int bar_length_ = 0;
    std::string done_color_;
    std::string progress_color_;
    std::string fill_char_;
    std::string description_;
    double throttle_ = 0.0;
    bool no_time_ = false;

    CLI::Option* bar_length_opt_ = nullptr;
    CLI::Option* done_color_opt_ = nullptr;
    CLI::Option* progress_color_opt_ = nullptr;
    CLI::Option* fill_opt_ = nullptr;
    CLI::Option* description_opt_ = nullptr;
    CLI::Option* throttle_opt_ = nullptr;

    void applyOverrides(common::GlobalConfig& config) const;
};

}}
