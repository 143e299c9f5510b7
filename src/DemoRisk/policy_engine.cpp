#include "policy_engine.h"
#include "output_schema.h"
#include "table_helpers.h"

#include "DemoRisk.Core/typed_column.h"

#include <fmt/format.h>

#include <stdexcept>

namespace drisk {

PolicyEngine::PolicyEngine(PolicyThresholds thresholds)
    : rules_{{thresholds.immediate_audit, actions::immediate_audit},
             {thresholds.targeted_investigation, actions::targeted_investigation},
             {thresholds.monitor, actions::monitor}} {
    if (!(thresholds.immediate_audit >= thresholds.targeted_investigation &&
          thresholds.targeted_investigation >= thresholds.monitor)) {
        throw std::invalid_argument(fmt::format(
            "Policy thresholds must be in descending order, actual: {}, {}, {}.",
            thresholds.immediate_audit, thresholds.targeted_investigation, thresholds.monitor));
    }
}

ScoringStageType PolicyEngine::type() const noexcept { return ScoringStageType::Policy; }

const std::string &PolicyEngine::name() const noexcept { return name_; }

const std::string &PolicyEngine::recommend(double impact_score) const noexcept {
    for (const auto &rule : rules_) {
        if (impact_score > rule.threshold) {
            return rule.action;
        }
    }

    return actions::none;
}

void PolicyEngine::apply(core::DataTable &table) const {
    const auto impact = column_values<core::DoubleDataTableColumn>(table, columns::impact_score);

    auto recommended = std::vector<std::string>{};
    recommended.reserve(impact.size());
    for (const auto score : impact) {
        recommended.push_back(recommend(score));
    }

    table.add(std::make_unique<core::StringDataTableColumn>(columns::recommended_action,
                                                            std::move(recommended)));
}

} // namespace drisk
