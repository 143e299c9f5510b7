#include "anomaly_scoring.h"
#include "feature_scaler.h"
#include "output_schema.h"

#include "DemoRisk.Core/typed_column.h"

#include <stdexcept>

namespace drisk {

AnomalyScoring::AnomalyScoring(std::unique_ptr<AnomalyDetector> detector, unsigned int seed)
    : detector_{std::move(detector)}, seed_{seed} {
    if (!detector_) {
        throw std::invalid_argument("The anomaly detector must not be null.");
    }
}

ScoringStageType AnomalyScoring::type() const noexcept { return ScoringStageType::AnomalyModel; }

const std::string &AnomalyScoring::name() const noexcept { return name_; }

const AnomalyDetector &AnomalyScoring::detector() const noexcept { return *detector_; }

void AnomalyScoring::apply(core::DataTable &table) const {
    auto features = std::vector<std::string>(columns::model_features.cbegin(),
                                             columns::model_features.cend());
    auto scaler = StandardScaler{};
    auto data = scaler.fit_transform(make_feature_matrix(table, features));
    auto result = detector_->detect(data, seed_);

    table.add(
        std::make_unique<core::IntegerDataTableColumn>(columns::ml_flag, std::move(result.flags)));
    table.add(
        std::make_unique<core::DoubleDataTableColumn>(columns::ml_score, std::move(result.scores)));
}

} // namespace drisk
