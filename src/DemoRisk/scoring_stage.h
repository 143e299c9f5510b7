#pragma once

#include "DemoRisk.Core/datatable.h"

#include <cstdint>
#include <string>

namespace drisk {

/// @brief Scoring pipeline stages types enumeration, in execution order
enum class ScoringStageType : uint8_t {
    /// @brief Isolation forest anomaly model
    AnomalyModel,

    /// @brief Severity classifier
    Severity,

    /// @brief Explainability rules engine
    Explainability,

    /// @brief Confidence, persistence and impact composer
    RiskComposer,

    /// @brief Recommended action engine
    Policy,

    /// @brief State baseline comparator
    PeerComparison,

    /// @brief Pre-severe warning detector
    EarlyWarning,

    /// @brief Data trust scorer
    Trust,
};

/// @brief Scoring stage interface
///
/// @details A stage reads existing columns of the shared features table and appends its
/// own result columns, it never modifies or removes existing columns or rows.
class ScoringStage {
  public:
    /// @brief Destroys a ScoringStage instance
    virtual ~ScoringStage() = default;

    /// @brief Gets the stage type identifier
    /// @return The stage type identifier
    virtual ScoringStageType type() const noexcept = 0;

    /// @brief Gets the stage name
    /// @return The human-readable stage name
    virtual const std::string &name() const noexcept = 0;

    /// @brief Computes the stage results and appends them to the table
    /// @param table The shared features table
    /// @throws std::out_of_range for missing input columns.
    /// @throws std::invalid_argument for column type mismatch or duplicated output columns.
    virtual void apply(core::DataTable &table) const = 0;
};

} // namespace drisk
