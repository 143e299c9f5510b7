#include "risk_composer.h"
#include "output_schema.h"
#include "severity.h"
#include "table_helpers.h"

#include "DemoRisk.Core/typed_column.h"
#include "DemoRisk.Core/math_util.h"

#include <algorithm>
#include <cmath>

namespace drisk {

RiskComposer::RiskComposer(ImpactWeights weights) : weights_{weights} {}

ScoringStageType RiskComposer::type() const noexcept { return ScoringStageType::RiskComposer; }

const std::string &RiskComposer::name() const noexcept { return name_; }

std::vector<double> RiskComposer::confidence(const std::vector<double> &scores) {
    auto result = std::vector<double>(scores.size(), 0.0);
    if (scores.empty()) {
        return result;
    }

    auto max_score = *std::max_element(scores.cbegin(), scores.cend());
    if (max_score == 0.0 || !std::isfinite(max_score)) {
        return result;
    }

    std::transform(scores.cbegin(), scores.cend(), result.begin(), [max_score](double score) {
        return core::MathHelper::round_to(score / max_score, 3);
    });

    return result;
}

double RiskComposer::impact(double confidence, double persistence,
                            double total_population) const noexcept {
    auto value = weights_.confidence * confidence + weights_.persistence * persistence +
                 weights_.population * std::log1p(total_population);
    return core::MathHelper::round_to(value, 3);
}

void RiskComposer::apply(core::DataTable &table) const {
    using core::DoubleDataTableColumn;
    const auto scores = column_values<DoubleDataTableColumn>(table, columns::ml_score);
    const auto total = column_values<DoubleDataTableColumn>(table, columns::total_population);
    const auto levels = column_values<core::StringDataTableColumn>(table, columns::severity);

    auto severe = std::vector<double>{};
    severe.reserve(levels.size());
    for (const auto &level : levels) {
        severe.push_back(parse_severity(level) == Severity::severe ? 1.0 : 0.0);
    }

    auto conf = confidence(scores);
    auto keys = make_group_keys(table, {columns::district, columns::pincode});
    auto persistence = broadcast_group_mean(keys, severe);

    auto impact_score = std::vector<double>{};
    impact_score.reserve(total.size());
    for (std::size_t row = 0; row < total.size(); row++) {
        impact_score.push_back(impact(conf[row], persistence[row], total[row]));
    }

    table.add(std::make_unique<DoubleDataTableColumn>(columns::confidence, std::move(conf)));
    table.add(
        std::make_unique<DoubleDataTableColumn>(columns::persistence, std::move(persistence)));
    table.add(
        std::make_unique<DoubleDataTableColumn>(columns::impact_score, std::move(impact_score)));
}

} // namespace drisk
