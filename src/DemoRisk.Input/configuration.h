/**
 * @file
 * @brief Main header file for functionality related to loading config files
 *
 * This file contains definitions for the main functions required to load JSON-formatted
 * configuration files from disk and apply the command-line overrides.
 */
#pragma once

#include "poco.h"

#include "DemoRisk.Core/forward_type.h"
#include "DemoRisk/parameters.h"

#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>

namespace drisk::input {

/// @brief Command-line values that override the configuration file contents
struct ConfigurationOverrides {
    /// @brief The input files folder
    std::optional<std::string> data_folder;

    /// @brief The output folder where results will be saved
    std::optional<std::string> output_folder;

    /// @brief The anomaly model random seed
    std::optional<unsigned int> seed;

    /// @brief Indicates whether the application logging is verbose
    bool verbose{};
};

/// @brief Defines the application configuration data structure
struct Configuration {
    /// @brief The root path for configuration files
    std::filesystem::path root_path;

    /// @brief The input records files details
    FileInfo file;

    /// @brief The input records date layout
    core::DateFormat date_format{core::DateFormat::automatic};

    /// @brief The scoring constants
    ScoringParameters parameters;

    /// @brief Output folder and report file information
    OutputInfo output;

    /// @brief Application logging verbosity mode
    core::VerboseMode verbosity{};

    /// @brief Application name
    const char *app_name = PROJECT_NAME;

    /// @brief Application version
    const char *app_version = PROJECT_VERSION;
};

/// @brief Represents an error that occurred with the format of a config file
class ConfigurationError : public std::runtime_error {
  public:
    ConfigurationError(const std::string &msg);
};

/// @brief Loads the input configuration file, *.json, information
/// @param config_file Path to config file
/// @param overrides The command-line overrides
/// @param schema_directory The JSON schemas folder, empty for the folder beside the executable
/// @return The configuration file information
/// @throws ConfigurationError for invalid file contents.
Configuration get_configuration(const std::filesystem::path &config_file,
                                const ConfigurationOverrides &overrides,
                                const std::filesystem::path &schema_directory = {});

/// @brief Converts the configuration date format name to the respective layout
/// @param name The format name: auto, iso or day_first, case-insensitive
/// @return The date layout
/// @throws ConfigurationError for unknown format names.
core::DateFormat parse_date_format(const std::string &name);

/// @brief Expand environment variables in path to respective values
/// @param path The source path to information
/// @return The resulting full path
std::string expand_environment_variables(const std::string &path);
} // namespace drisk::input
