#pragma once

#include <filesystem>
#include <string>

/// @brief The example configuration and dataset folder in use
extern std::string test_examples_path;

/// @brief The JSON schemas folder in use
extern std::string test_schemas_path;

/// @brief Gets the example folder, the command-line value or the source tree default
std::filesystem::path default_examples_path();

/// @brief Gets the JSON schemas folder, the command-line value or the source tree default
std::filesystem::path default_schemas_path();
