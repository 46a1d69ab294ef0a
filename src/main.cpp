#include <iostream>
#include <vector>
#include <string>
#include "cli/brickdev_cli.hpp"
#include "cli/theme.hpp"
#include <core/constants.hpp>

int main(int argc, char** argv) {
    try {
        BrickdevCLI cli;
        register_device_commands(cli);
        register_compile_commands(cli);

        if (argc == 1) {
            cli.print_usage();
            return 1;
        }

        std::string cmd = argv[1];

        if (cmd == "--version" || cmd == "-v") {
            std::cout << theme::color::BROWN << theme::color::BOLD << "brickdev"
                      << theme::color::RESET << theme::color::DIM
                      << " version " << BRICKDEV_VERSION << theme::color::RESET << "\n";
            return 0;
        } else if (cmd == "--help" || cmd == "-h") {
            cli.print_usage();
            return 0;
        }

        std::vector<std::string> args(argv + 2, argv + argc);
        return cli.execute_command(cmd, args);
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
