#include <iostream>
#include <vector>
#include <string>
#include <core/config.hpp>
#include <core/constants.hpp>
#include "cli/lifeline_cli.hpp"
#include "cli/theme.hpp"

void print_usage() {
    std::cout << theme::section("Usage");
    std::cout << theme::color::BLUE << "    lifeline "
              << theme::color::RESET << theme::color::BROWN << "<task>..."
              << theme::color::RESET << theme::color::DIM
              << "          Invoke tasks (e.g. nightly:lifeline)" << theme::color::RESET << "\n";
    std::cout << theme::color::BLUE << "    lifeline --tasks"
              << theme::color::RESET << theme::color::DIM
              << "            List tasks defined by lifeline.yaml" << theme::color::RESET << "\n";
    std::cout << theme::color::BLUE << "    lifeline --config "
              << theme::color::RESET << theme::color::BROWN << "<path>"
              << theme::color::RESET << theme::color::DIM
              << "    Use another config file" << theme::color::RESET << "\n";
    std::cout << "\n";
    std::cout << theme::color::DIM
              << "    lifeline --version        Show version\n"
              << "    lifeline --help           Show this help"
              << theme::color::RESET << "\n\n";
}

int main(int argc, char** argv) {
    try {
        std::string config_path;
        bool list_tasks = false;
        std::vector<std::string> tasks;

        for (int i = 1; i < argc; i++) {
            std::string arg = argv[i];

            if (arg == "--version") {
                std::cout << theme::color::BROWN << theme::color::BOLD << "lifeline"
                          << theme::color::RESET << theme::color::DIM
                          << " version " << LIFELINE_VERSION << theme::color::RESET << "\n";
                return 0;
            } else if (arg == "--help" || arg == "-h") {
                print_usage();
                return 0;
            } else if (arg == "--tasks" || arg == "-T") {
                list_tasks = true;
            } else if (arg == "--config" || arg == "-c") {
                if (i + 1 >= argc) {
                    std::cout << theme::fail("Missing path after " + arg);
                    return 1;
                }
                config_path = argv[++i];
            } else if (!arg.empty() && arg[0] == '-') {
                std::cout << theme::fail("Unknown option: " + arg);
                print_usage();
                return 1;
            } else {
                tasks.push_back(arg);
            }
        }

        if (!list_tasks && tasks.empty()) {
            print_usage();
            return 1;
        }

        auto config = config_path.empty() ? Config::load_project()
                                          : Config::load_file(config_path);
        if (config.is_err()) {
            std::cout << theme::fail(config.error);
            return 1;
        }

        LifelineCLI cli(std::move(config.value));
        if (list_tasks) {
            cli.print_tasks();
        }
        return cli.run_tasks(tasks);
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
