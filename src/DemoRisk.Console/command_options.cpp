#include "command_options.h"

#include "DemoRisk.Core/version.h"

#include <fmt/color.h>

#include <iostream>
#include <stdexcept>

namespace drisk {

cxxopts::Options create_options() {
    cxxopts::Options options("DemoRisk.Console",
                             "DemoRisk demographic registration anomaly scoring.");

    // clang-format off
    options.add_options()
        ("c,config", "Path to configuration file.", cxxopts::value<std::string>())
        ("d,data", "Path to the input records folder, overrides the configuration.",
            cxxopts::value<std::string>())
        ("o,output", "Path to output folder, overrides the configuration.",
            cxxopts::value<std::string>())
        ("s,seed", "The anomaly model random seed, overrides the configuration.",
            cxxopts::value<unsigned int>())
        ("T,threads", "The maximum number of threads to create (0: no limit, default).",
            cxxopts::value<size_t>())
        ("verbose", "Print more information about progress",
            cxxopts::value<bool>()->default_value("false"))
        ("help", "Help for this application.")
        ("version", "Print the application version number.");
    // clang-format on

    return options;
}

std::optional<CommandOptions> parse_arguments(cxxopts::Options &options, int argc, char **argv) {
    CommandOptions cmd;
    auto result = options.parse(argc, argv);

    if (result.count("help")) {
        std::cout << options.help() << '\n';
        return std::nullopt;
    }

    if (result.count("version")) {
        fmt::print("Version {}, API {}\n\n", PROJECT_VERSION, core::Version::GetVersion());
        return std::nullopt;
    }

    cmd.overrides.verbose = result["verbose"].as<bool>();
    if (cmd.overrides.verbose) {
        fmt::print(fmt::fg(fmt::color::dark_salmon), "Verbose output enabled\n");
    }

    if (!result.count("config")) {
        throw std::invalid_argument("Missing required configuration file argument: -c/--config.");
    }

    cmd.config_file = result["config"].as<std::string>();
    fmt::print("Configuration file: {}\n", cmd.config_file);

    if (result.count("data")) {
        cmd.overrides.data_folder = result["data"].as<std::string>();
    }

    if (result.count("output")) {
        cmd.overrides.output_folder = result["output"].as<std::string>();
    }

    if (result.count("seed")) {
        cmd.overrides.seed = result["seed"].as<unsigned int>();
    }

    if (result.count("threads")) {
        cmd.num_threads = result["threads"].as<size_t>();
    }

    return cmd;
}
} // namespace drisk
