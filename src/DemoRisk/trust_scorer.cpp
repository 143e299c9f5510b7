#include "trust_scorer.h"
#include "output_schema.h"
#include "severity.h"
#include "table_helpers.h"

#include "DemoRisk.Core/typed_column.h"
#include "DemoRisk.Core/math_util.h"

#include <algorithm>

namespace drisk {

TrustScorer::TrustScorer(TrustWeights weights) : weights_{weights} {}

ScoringStageType TrustScorer::type() const noexcept { return ScoringStageType::Trust; }

const std::string &TrustScorer::name() const noexcept { return name_; }

double TrustScorer::score(double persistence, bool severe) const noexcept {
    auto penalty = weights_.persistence * persistence + weights_.severe * (severe ? 1.0 : 0.0);
    return core::MathHelper::round_to(std::clamp(1.0 - penalty, 0.0, 1.0), 2);
}

void TrustScorer::apply(core::DataTable &table) const {
    const auto levels = column_values<core::StringDataTableColumn>(table, columns::severity);
    const auto persistence =
        column_values<core::DoubleDataTableColumn>(table, columns::persistence);

    auto trust = std::vector<double>{};
    trust.reserve(levels.size());
    for (std::size_t row = 0; row < levels.size(); row++) {
        trust.push_back(score(persistence[row], parse_severity(levels[row]) == Severity::severe));
    }

    table.add(
        std::make_unique<core::DoubleDataTableColumn>(columns::data_trust_score, std::move(trust)));
}

} // namespace drisk
