/**
 * @file
 * @brief This file contains functions for loading subsections of the main JSON file
 */
#pragma once
#include "configuration.h"

#include <nlohmann/json.hpp>

namespace drisk::input {
/// @brief Check the schema version and throw if invalid
/// @param j The root JSON object
/// @throw ConfigurationError: If version attribute is not present or invalid
void check_version(const nlohmann::json &j);

/// @brief Load input files section
/// @param j The root JSON object
/// @param config The config object to update
/// @param data_folder Input files folder, if provided via command-line argument
/// @throw ConfigurationError: Could not load input files info
void load_input_info(const nlohmann::json &j, Configuration &config,
                     const std::optional<std::string> &data_folder);

/// @brief Load the scoring parameters from the modelling section, if present
/// @param j The root JSON object
/// @param config The config object to update
/// @param seed Anomaly model seed, if provided via command-line argument
/// @throw ConfigurationError: Could not load modelling info
void load_modelling_info(const nlohmann::json &j, Configuration &config,
                         std::optional<unsigned int> seed);

/// @brief Load output section of JSON object
/// @param j The root JSON object
/// @param config The config object to update
/// @param output_folder Output folder, if provided via command-line argument
/// @throw ConfigurationError: Could not load output info
void load_output_info(const nlohmann::json &j, Configuration &config,
                      const std::optional<std::string> &output_folder);
} // namespace drisk::input
