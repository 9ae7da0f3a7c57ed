#include "main_command.hpp"

namespace progviz {
namespace cli {

MainCommand::MainCommand() = default;
MainCommand::~MainCommand() = default;

bool MainCommand::wasCalled() const {
    return was_called_;
}

void MainCommand::markCalledOnParse() {
    if (subcommand_) {
        subcommand_->callback([this]() { was_called_ = true; });
    }
}

}}
