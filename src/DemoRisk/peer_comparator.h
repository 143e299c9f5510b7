#pragma once

#include "scoring_stage.h"

#include <string>

namespace drisk {

/// @brief Compares each record youth ratio with its state baseline
///
/// @details Adds @c state_avg_youth_ratio, the mean youth ratio of the record state, and
/// @c peer_deviation, the record youth ratio minus the baseline rounded to 3 decimals.
class PeerComparator final : public ScoringStage {
  public:
    ScoringStageType type() const noexcept override;

    const std::string &name() const noexcept override;

    void apply(core::DataTable &table) const override;

  private:
    std::string name_{"Peer Comparison"};
};

} // namespace drisk
