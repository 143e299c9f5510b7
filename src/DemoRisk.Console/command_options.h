/**
 * @file
 * @brief Functionality for parsing console application's command-line arguments
 */
#pragma once

#include <cxxopts.hpp>

#include "DemoRisk.Input/configuration.h"

#include <optional>
#include <string>

namespace drisk {
/// @brief Defines the Command Line Interface (CLI) arguments options
struct CommandOptions {
    /// @brief The configuration file full path
    std::string config_file;

    /// @brief The configuration values overridden in the command-line
    input::ConfigurationOverrides overrides;

    /// @brief The maximum number of threads to use (0: no limit).
    size_t num_threads{};
};

/// @brief Creates the command-line interface (CLI) options
/// @return DemoRisk CLI options
cxxopts::Options create_options();

/// @brief Parses the command-line interface (CLI) arguments
/// @param options The valid CLI options
/// @param argc Number of input arguments
/// @param argv List of input arguments
/// @return User command-line options or std::nullopt if program should exit
std::optional<CommandOptions> parse_arguments(cxxopts::Options &options, int argc, char **argv);

} // namespace drisk
