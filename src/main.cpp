#include <CLI/CLI.hpp>
#include <iostream>
#include <memory>
#include <string>

#include "progviz/common/config.hpp"
#include "progviz/common/constants.hpp"
#include "progviz/common/error_codes.hpp"
#include "progviz/common/logger.hpp"
#include "cli/colors_command.hpp"
#include "cli/demo_command.hpp"

int main(int argc, char** argv) {
    try {
        CLI::App app{"Terminal progress bar for iterations", progviz::constants::system::APPLICATION_NAME};
        app.set_version_flag("--version,-v", progviz::constants::version::getFullVersion());
        app.require_subcommand(0, 1);

        std::string config_path;
        bool verbose = false;
        app.add_option("-c,--config", config_path, "Configuration file path");
        app.add_flag("--verbose", verbose, "Enable debug logging");

        auto demo_cmd = std::make_unique<progviz::cli::DemoCommand>();
        auto colors_cmd = std::make_unique<progviz::cli::ColorsCommand>();

        demo_cmd->setup(app.add_subcommand("demo", "Iterate a range of integers with a progress bar"));
        colors_cmd->setup(app.add_subcommand("colors", "List supported bar colors"));

        CLI11_PARSE(app, argc, argv);

        auto& config = progviz::common::Config::instance();
        bool config_loaded = config.load(config_path);

        const auto& logging = config.global().logging;
        progviz::common::Logger::instance().initialize(
            logging.log_file.empty() ? progviz::common::LogMode::CONSOLE_ONLY
                                     : progviz::common::LogMode::FILE_ONLY,
            logging);

        if (verbose) {
            progviz::common::Logger::instance().setLevel(progviz::common::LogLevel::DEBUG);
        }

        if (!config_loaded) {
            std::cerr << "\033[33mWarning: configuration not loaded, using defaults\033[0m\n";
        }

        int result = 0;
        if (demo_cmd->wasCalled()) {
            result = demo_cmd->execute();
        } else if (colors_cmd->wasCalled()) {
            result = colors_cmd->execute();
        } else {
            std::cout << app.help() << std::endl;
        }

        progviz::common::Logger::instance().shutdown();
        return result;

    } catch (const progviz::common::ConfigError& e) {
        std::cerr << "Configuration error [" << e.codeString() << "]: " << e.what() << std::endl;
        return 1;
    } catch (const progviz::common::VisualizerError& e) {
        std::cerr << "Error [" << e.codeString() << "]: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
