#pragma once

#include <CLI/CLI.hpp>
#include <string>

namespace progviz {
namespace cli {

class MainCommand {
public:
    MainCommand();
    virtual ~MainCommand();

    virtual void setup(CLI::App* subcommand) = 0;
    virtual int execute() = 0;

    bool wasCalled() const;

protected:
    CLI::App* subcommand_ = nullptr;
    bool was_called_ = false;

    void markCalledOnParse();
};

}}
