#pragma once

#include "main_command.hpp"
#include <CLI/CLI.hpp>

namespace progviz {
namespace cli {

class ColorsCommand : public MainCommand {
public:
    ColorsCommand();

    void setup(CLI::App* subcommand) override;
    int execute() override;
};

}}
