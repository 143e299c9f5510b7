#pragma once

#include "parameters.h"
#include "scoring_stage.h"

#include <functional>
#include <string>
#include <vector>

namespace drisk {

/// @brief Record feature values used by the explainability rules
struct RecordFeatures {
    double total_population{};
    double youth_ratio{};
    double pop_change{};
    double shock_score{};
};

/// @brief Tagged explanation rule, contributes its reason when the predicate holds
struct ReasonRule {
    /// @brief The human-readable reason
    std::string reason;

    /// @brief The rule predicate over the record features
    std::function<bool(const RecordFeatures &)> matches;
};

/// @brief Derives human-readable reasons from the record features
///
/// @details The reasons are independent of the anomaly model internals, every matching
/// rule contributes, in rule order, joined by "; ".
class ExplainabilityEngine final : public ScoringStage {
  public:
    /// @brief Reason reported when no rule matches
    static inline const std::string fallback_reason{"Multi-factor deviation"};

    /// @brief Initialise a new instance of the ExplainabilityEngine class.
    /// @param thresholds The rules feature thresholds
    explicit ExplainabilityEngine(ExplainabilityThresholds thresholds);

    ScoringStageType type() const noexcept override;

    const std::string &name() const noexcept override;

    void apply(core::DataTable &table) const override;

    /// @brief Gets the ordered explanation rules
    const std::vector<ReasonRule> &rules() const noexcept;

    /// @brief Explains one record
    /// @param features The record features
    /// @return The joined matching reasons, or the fallback reason
    std::string explain(const RecordFeatures &features) const;

  private:
    std::vector<ReasonRule> rules_;
    std::string name_{"Explainability"};
};

} // namespace drisk
