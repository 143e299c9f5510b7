#include "explainability.h"
#include "output_schema.h"
#include "table_helpers.h"

#include "DemoRisk.Core/typed_column.h"
#include "DemoRisk.Core/string_util.h"

#include <cmath>

namespace drisk {

ExplainabilityEngine::ExplainabilityEngine(ExplainabilityThresholds thresholds)
    : rules_{
          {"Youth-heavy population",
           [youth = thresholds.youth_heavy_ratio](const RecordFeatures &f) {
               return f.youth_ratio > youth;
           }},
          {"Ageing population",
           [ageing = thresholds.ageing_ratio](const RecordFeatures &f) {
               return f.youth_ratio < ageing;
           }},
          {"Sudden demographic shock",
           [shock = thresholds.shock_score](const RecordFeatures &f) {
               return std::abs(f.shock_score) > shock;
           }},
          {"Large population swing",
           [swing = thresholds.swing_fraction](const RecordFeatures &f) {
               return std::abs(f.pop_change) > swing * f.total_population;
           }},
      } {}

ScoringStageType ExplainabilityEngine::type() const noexcept {
    return ScoringStageType::Explainability;
}

const std::string &ExplainabilityEngine::name() const noexcept { return name_; }

const std::vector<ReasonRule> &ExplainabilityEngine::rules() const noexcept { return rules_; }

std::string ExplainabilityEngine::explain(const RecordFeatures &features) const {
    auto reasons = std::vector<std::string>{};
    for (const auto &rule : rules_) {
        if (rule.matches(features)) {
            reasons.push_back(rule.reason);
        }
    }

    if (reasons.empty()) {
        return fallback_reason;
    }

    return core::join_strings("; ", reasons);
}

void ExplainabilityEngine::apply(core::DataTable &table) const {
    using core::DoubleDataTableColumn;
    const auto total = column_values<DoubleDataTableColumn>(table, columns::total_population);
    const auto youth = column_values<DoubleDataTableColumn>(table, columns::youth_ratio);
    const auto change = column_values<DoubleDataTableColumn>(table, columns::pop_change);
    const auto shock = column_values<DoubleDataTableColumn>(table, columns::shock_score);

    auto reasons = std::vector<std::string>{};
    reasons.reserve(total.size());
    for (std::size_t row = 0; row < total.size(); row++) {
        reasons.push_back(explain(RecordFeatures{.total_population = total[row],
                                                 .youth_ratio = youth[row],
                                                 .pop_change = change[row],
                                                 .shock_score = shock[row]}));
    }

    table.add(std::make_unique<core::StringDataTableColumn>(columns::reason, std::move(reasons)));
}

} // namespace drisk
