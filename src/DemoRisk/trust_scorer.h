#pragma once

#include "parameters.h"
#include "scoring_stage.h"

#include <string>

namespace drisk {

/// @brief Discounts the data trust of records with a severe anomaly history
///
/// @details Adds @c data_trust_score, one minus the weighted persistence and severe
/// indicator, clipped to [0, 1] and rounded to 2 decimals.
class TrustScorer final : public ScoringStage {
  public:
    /// @brief Initialise a new instance of the TrustScorer class.
    /// @param weights The trust score weights
    explicit TrustScorer(TrustWeights weights);

    ScoringStageType type() const noexcept override;

    const std::string &name() const noexcept override;

    void apply(core::DataTable &table) const override;

    /// @brief Computes the trust score of one record
    /// @param persistence The record geography persistence
    /// @param severe Whether the record is SEVERE
    /// @return The trust score in [0, 1]
    double score(double persistence, bool severe) const noexcept;

  private:
    TrustWeights weights_;
    std::string name_{"Data Trust"};
};

} // namespace drisk
