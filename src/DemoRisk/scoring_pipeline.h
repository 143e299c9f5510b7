#pragma once

#include "aggregator.h"
#include "anomaly_detector.h"
#include "feature_builder.h"
#include "parameters.h"
#include "scoring_stage.h"

#include "DemoRisk.Core/datatable.h"
#include "DemoRisk.Core/exception.h"
#include "DemoRisk.Core/forward_type.h"

#include <memory>
#include <vector>

namespace drisk {

/// @brief Raised when no input record survives the cleaning step
class NoUsableRecordsError : public core::DemoRiskException {
  public:
    using core::DemoRiskException::DemoRiskException;
};

/// @brief The scoring run output contract
struct ScoringResult {
    /// @brief Every retained record with all scored columns, in output column order
    core::DataTable scored;

    std::vector<DistrictRisk> district_ranking;

    core::DataTable policy_alerts;

    core::DataTable early_warning_zones;

    RunSummary summary;
};

/// @brief Runs the scoring stages left to right over one shared table
///
/// @details The feature builder cleans and enriches the raw records, then each stage
/// appends its columns: anomaly model, severity, explainability, risk composer, policy,
/// peer comparison, early warning and data trust. The aggregated views are derived
/// from the final table.
class ScoringPipeline {
  public:
    ScoringPipeline() = delete;

    /// @brief Initialise a new instance of the ScoringPipeline class with an isolation forest.
    /// @param parameters The scoring parameters
    /// @param date_format The input date layout
    /// @param verbosity The console messages verbosity
    /// @throws std::invalid_argument for invalid parameter values.
    explicit ScoringPipeline(const ScoringParameters &parameters,
                             core::DateFormat date_format = core::DateFormat::automatic,
                             core::VerboseMode verbosity = core::VerboseMode::none);

    /// @brief Initialise a new instance of the ScoringPipeline class.
    /// @param parameters The scoring parameters
    /// @param detector The anomaly detector instance
    /// @param date_format The input date layout
    /// @param verbosity The console messages verbosity
    /// @throws std::invalid_argument for invalid parameter values or null detector.
    ScoringPipeline(const ScoringParameters &parameters, std::unique_ptr<AnomalyDetector> detector,
                    core::DateFormat date_format = core::DateFormat::automatic,
                    core::VerboseMode verbosity = core::VerboseMode::none);

    /// @brief Scores the raw records
    /// @param raw The raw records table
    /// @return The scored table and the aggregated views
    /// @throws NoUsableRecordsError when no record survives the cleaning step.
    /// @throws std::out_of_range for missing required input columns.
    ScoringResult run(const core::DataTable &raw) const;

    /// @brief Gets the scoring parameters
    const ScoringParameters &parameters() const noexcept;

    /// @brief Gets the scoring stages, in execution order
    const std::vector<std::unique_ptr<ScoringStage>> &stages() const noexcept;

  private:
    ScoringParameters parameters_;
    FeatureBuilder builder_;
    std::vector<std::unique_ptr<ScoringStage>> stages_;
    core::VerboseMode verbosity_;
};

} // namespace drisk
