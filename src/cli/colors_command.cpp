#include "colors_command.hpp"
#include "progviz/terminal/color.hpp"
#include <iostream>

namespace progviz {
namespace cli {

ColorsCommand::ColorsCommand() = default;

void ColorsCommand::setup(CLI::App* subcommand) {
    subcommand_ = subcommand;
    markCalledOnParse();
}

int ColorsCommand::execute() {
    for (auto color : terminal::ALL_COLORS) {
        std::cout << "  " << terminal::colorize(terminal::to_string(color), color) << "\n";
    }
    std::cout << std::flush;
    return 0;
}

}}
