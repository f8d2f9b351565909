#include "cli/cli.h"
#include "utils/log_utils.h"
#include "utils/string_utils.h"

#include <spdlog/cfg/env.h>
#include <spdlog/spdlog.h>
#include <torch/version.h>

#include <cstdlib>
#include <iostream>
#include <map>
#include <string_view>
#include <vector>

using entry_ptr = int (*)(int, char**);

namespace {

void usage(const std::map<std::string_view, entry_ptr>& commands) {
    std::cout << "Usage: clarion [options] subcommand\n\n"
              << "Positional arguments:\n";

    for (const auto& command : commands) {
        std::cout << command.first << '\n';
    }

    std::cout << "\nOptional arguments:\n"
              << "-h --help               shows help message and exits\n"
              << "-v --version            prints version information and exits\n"
              << "-vv                     prints verbose version information and exits\n";
}

}  // namespace

int main(int argc, char* argv[]) {
    // Load logging settings from environment/command-line.
    spdlog::cfg::load_env_levels();
    clarion::utils::InitLogging();

    const std::map<std::string_view, entry_ptr> subcommands = {
            {"call_variants", &clarion::call_variants},
    };

    const std::vector<std::string_view> arguments(argv + 1, argv + argc);
    if (arguments.size() == 0) {
        usage(subcommands);
        return EXIT_SUCCESS;
    }

    // Log cmd
    spdlog::info("Running: \"{}\"", clarion::utils::join(arguments, "\" \""));

    const auto& subcommand = arguments[0];

    if (subcommand == "-v" || subcommand == "--version") {
        std::cout << CLARION_VERSION << '\n';
    } else if (subcommand == "-vv") {
        std::cout << "clarion:  " << CLARION_VERSION << '\n';
        std::cout << "libtorch: " << TORCH_VERSION << '\n';
    } else if (subcommand == "-h" || subcommand == "--help") {
        usage(subcommands);
        return EXIT_SUCCESS;
    } else if (subcommands.find(subcommand) != subcommands.end()) {
        return subcommands.at(subcommand)(--argc, ++argv);
    } else {
        usage(subcommands);
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
