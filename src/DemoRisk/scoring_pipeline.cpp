#include "scoring_pipeline.h"
#include "anomaly_scoring.h"
#include "early_warning.h"
#include "explainability.h"
#include "isolation_forest.h"
#include "peer_comparator.h"
#include "policy_engine.h"
#include "risk_composer.h"
#include "severity.h"
#include "trust_scorer.h"

#include "DemoRisk.Core/scoped_timer.h"

#include <fmt/color.h>
#include <fmt/format.h>

#include <chrono>

#if USE_TIMER
#define MEASURE_FUNCTION()                                                                         \
    drisk::core::ScopedTimer timer { __func__ }
#else
#define MEASURE_FUNCTION()
#endif

namespace drisk {

ScoringPipeline::ScoringPipeline(const ScoringParameters &parameters, core::DateFormat date_format,
                                 core::VerboseMode verbosity)
    : ScoringPipeline(parameters, std::make_unique<IsolationForest>(parameters.anomaly_model),
                      date_format, verbosity) {}

ScoringPipeline::ScoringPipeline(const ScoringParameters &parameters,
                                 std::unique_ptr<AnomalyDetector> detector,
                                 core::DateFormat date_format, core::VerboseMode verbosity)
    : parameters_{parameters}, builder_{date_format}, verbosity_{verbosity} {
    stages_.push_back(
        std::make_unique<AnomalyScoring>(std::move(detector), parameters_.anomaly_model.seed));
    stages_.push_back(std::make_unique<SeverityClassifier>(parameters_.severity));
    stages_.push_back(std::make_unique<ExplainabilityEngine>(parameters_.explainability));
    stages_.push_back(std::make_unique<RiskComposer>(parameters_.impact_weights));
    stages_.push_back(std::make_unique<PolicyEngine>(parameters_.policy_thresholds));
    stages_.push_back(std::make_unique<PeerComparator>());
    stages_.push_back(std::make_unique<EarlyWarningDetector>(parameters_.early_warning));
    stages_.push_back(std::make_unique<TrustScorer>(parameters_.trust_weights));
}

const ScoringParameters &ScoringPipeline::parameters() const noexcept { return parameters_; }

const std::vector<std::unique_ptr<ScoringStage>> &ScoringPipeline::stages() const noexcept {
    return stages_;
}

ScoringResult ScoringPipeline::run(const core::DataTable &raw) const {
    MEASURE_FUNCTION();
    auto features = builder_.build(raw);
    const auto &cleaning = features.cleaning;
    if (verbosity_ == core::VerboseMode::verbose) {
        fmt::print("Records: {} input, {} invalid dates, {} non-positive totals, {} retained.\n",
                   cleaning.input_rows, cleaning.invalid_dates, cleaning.non_positive_totals,
                   cleaning.retained_rows);
    }

    // Fatal only when every input record was rejected
    if (cleaning.input_rows > 0 && cleaning.retained_rows == 0) {
        throw NoUsableRecordsError(fmt::format(
            "No usable records after cleaning: {} input rows, {} invalid dates, {} non-positive "
            "totals.",
            cleaning.input_rows, cleaning.invalid_dates, cleaning.non_positive_totals));
    }

    auto result = ScoringResult{};
    result.scored = std::move(features.table);
    for (const auto &stage : stages_) {
        auto start = std::chrono::steady_clock::now();
        stage->apply(result.scored);
        if (verbosity_ == core::VerboseMode::verbose) {
            auto elapsed = std::chrono::duration<double, std::milli>(
                std::chrono::steady_clock::now() - start);
            fmt::print(fmt::fg(fmt::color::cyan), "Stage {:<16} completed in {:.1f} ms.\n",
                       stage->name(), elapsed.count());
        }
    }

    result.district_ranking = Aggregator::district_ranking(result.scored);
    result.policy_alerts = Aggregator::policy_alerts(result.scored);
    result.early_warning_zones = Aggregator::early_warning_zones(result.scored);
    result.summary = Aggregator::summarise(result.scored, cleaning);
    return result;
}

} // namespace drisk
