#pragma once

#include "DemoRisk.Input/poco.h"
#include "DemoRisk/parameters.h"

#include <fmt/format.h>
#include <string>

namespace drisk {
/// @brief Scoring run information for reproducibility.
struct RunInfo {
    /// @brief The model name
    std::string model;

    /// @brief The model version
    std::string version;

    /// @brief The input records files
    input::FileInfo inputs;

    /// @brief The scoring constants in effect
    ScoringParameters parameters;

    /// @brief Creates a string representation of this instance
    /// @return The string representation
    std::string to_string() const noexcept {
        return fmt::format("{} v{} - {} ({}) seed: {}", model, version, inputs.folder.string(),
                           inputs.file_pattern, parameters.anomaly_model.seed);
    }
};
} // namespace drisk
