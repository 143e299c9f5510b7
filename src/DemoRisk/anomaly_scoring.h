#pragma once

#include "anomaly_detector.h"
#include "scoring_stage.h"

#include <memory>
#include <string>

namespace drisk {

/// @brief Scores the standardised model features with an anomaly detector
///
/// @details Builds the matrix of @c total_population, @c youth_ratio, @c pop_change and
/// @c shock_score, standardises it and adds the detector @c ml_flag and @c ml_score columns.
class AnomalyScoring final : public ScoringStage {
  public:
    AnomalyScoring() = delete;

    /// @brief Initialise a new instance of the AnomalyScoring class.
    /// @param detector The anomaly detector instance
    /// @param seed The detector random engine seed
    /// @throws std::invalid_argument for null detector.
    AnomalyScoring(std::unique_ptr<AnomalyDetector> detector, unsigned int seed);

    ScoringStageType type() const noexcept override;

    const std::string &name() const noexcept override;

    void apply(core::DataTable &table) const override;

    /// @brief Gets the anomaly detector instance
    const AnomalyDetector &detector() const noexcept;

  private:
    std::unique_ptr<AnomalyDetector> detector_;
    unsigned int seed_;
    std::string name_{"Anomaly Model"};
};

} // namespace drisk
