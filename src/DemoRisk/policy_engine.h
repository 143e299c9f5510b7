#pragma once

#include "parameters.h"
#include "scoring_stage.h"

#include <string>
#include <vector>

namespace drisk {

/// @brief Recommended action labels
namespace actions {
inline const std::string immediate_audit = "Immediate audit & field verification";
inline const std::string targeted_investigation = "Targeted demographic investigation";
inline const std::string monitor = "Monitor closely";
inline const std::string none = "No action";
} // namespace actions

/// @brief Action rule, recommends its action for impact scores strictly above the threshold
struct ActionRule {
    double threshold;
    std::string action;
};

/// @brief Maps the impact score to a recommended action
///
/// @details Rules are checked in descending threshold order and the first match wins,
/// scores at or below every threshold get no action.
class PolicyEngine final : public ScoringStage {
  public:
    /// @brief Initialise a new instance of the PolicyEngine class.
    /// @param thresholds The action thresholds
    /// @throws std::invalid_argument for thresholds not in descending order.
    explicit PolicyEngine(PolicyThresholds thresholds);

    ScoringStageType type() const noexcept override;

    const std::string &name() const noexcept override;

    void apply(core::DataTable &table) const override;

    /// @brief Recommends the action for an impact score
    /// @param impact_score The record impact score
    /// @return The recommended action label
    const std::string &recommend(double impact_score) const noexcept;

  private:
    std::vector<ActionRule> rules_;
    std::string name_{"Policy"};
};

} // namespace drisk
