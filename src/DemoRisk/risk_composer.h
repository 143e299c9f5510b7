#pragma once

#include "parameters.h"
#include "scoring_stage.h"

#include <string>
#include <vector>

namespace drisk {

/// @brief Combines model confidence, severe persistence and population scale into an impact score
///
/// @details Adds three columns:
/// - @c confidence, the model score divided by the run maximum, rounded to 3 decimals;
/// - @c persistence, the fraction of SEVERE records of each (district, pincode);
/// - @c impact_score, the weighted sum of confidence, persistence and log(1 + total population),
///   rounded to 3 decimals.
class RiskComposer final : public ScoringStage {
  public:
    /// @brief Initialise a new instance of the RiskComposer class.
    /// @param weights The impact score weights
    explicit RiskComposer(ImpactWeights weights);

    ScoringStageType type() const noexcept override;

    const std::string &name() const noexcept override;

    void apply(core::DataTable &table) const override;

    /// @brief Normalises the model scores by their maximum value
    /// @param scores The model decision scores
    /// @return The rounded confidence values, all zero for a zero maximum
    static std::vector<double> confidence(const std::vector<double> &scores);

    /// @brief Computes the impact score of one record
    /// @param confidence The record confidence
    /// @param persistence The record geography persistence
    /// @param total_population The record total population
    /// @return The rounded impact score
    double impact(double confidence, double persistence, double total_population) const noexcept;

  private:
    ImpactWeights weights_;
    std::string name_{"Risk Composer"};
};

} // namespace drisk
