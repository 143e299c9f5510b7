#include "jsonparser.h"

namespace {
template <class T> void get_if_present(const nlohmann::json &j, const char *key, T &out) {
    if (j.contains(key)) {
        j.at(key).get_to(out);
    }
}
} // anonymous namespace

namespace drisk {

void to_json(json &j, const AnomalyModelParameters &p) {
    j = json{{"n_estimators", p.n_estimators},
             {"max_samples", p.max_samples},
             {"contamination", p.contamination},
             {"seed", p.seed}};
}

void from_json(const json &j, AnomalyModelParameters &p) {
    get_if_present(j, "n_estimators", p.n_estimators);
    get_if_present(j, "max_samples", p.max_samples);
    get_if_present(j, "contamination", p.contamination);
    get_if_present(j, "seed", p.seed);
}

void to_json(json &j, const SeverityParameters &p) {
    j = json{{"severe_percentile", p.severe_percentile}};
}

void from_json(const json &j, SeverityParameters &p) {
    get_if_present(j, "severe_percentile", p.severe_percentile);
}

void to_json(json &j, const ExplainabilityThresholds &p) {
    j = json{{"youth_heavy_ratio", p.youth_heavy_ratio},
             {"ageing_ratio", p.ageing_ratio},
             {"shock_score", p.shock_score},
             {"swing_fraction", p.swing_fraction}};
}

void from_json(const json &j, ExplainabilityThresholds &p) {
    get_if_present(j, "youth_heavy_ratio", p.youth_heavy_ratio);
    get_if_present(j, "ageing_ratio", p.ageing_ratio);
    get_if_present(j, "shock_score", p.shock_score);
    get_if_present(j, "swing_fraction", p.swing_fraction);
}

void to_json(json &j, const ImpactWeights &p) {
    j = json{{"confidence", p.confidence},
             {"persistence", p.persistence},
             {"population", p.population}};
}

void from_json(const json &j, ImpactWeights &p) {
    get_if_present(j, "confidence", p.confidence);
    get_if_present(j, "persistence", p.persistence);
    get_if_present(j, "population", p.population);
}

void to_json(json &j, const PolicyThresholds &p) {
    j = json{{"immediate_audit", p.immediate_audit},
             {"targeted_investigation", p.targeted_investigation},
             {"monitor", p.monitor}};
}

void from_json(const json &j, PolicyThresholds &p) {
    get_if_present(j, "immediate_audit", p.immediate_audit);
    get_if_present(j, "targeted_investigation", p.targeted_investigation);
    get_if_present(j, "monitor", p.monitor);
}

void to_json(json &j, const EarlyWarningParameters &p) {
    j = json{{"min_votes", p.min_votes},
             {"persistence", p.persistence},
             {"shock_score", p.shock_score},
             {"peer_deviation", p.peer_deviation}};
}

void from_json(const json &j, EarlyWarningParameters &p) {
    get_if_present(j, "min_votes", p.min_votes);
    get_if_present(j, "persistence", p.persistence);
    get_if_present(j, "shock_score", p.shock_score);
    get_if_present(j, "peer_deviation", p.peer_deviation);
}

void to_json(json &j, const TrustWeights &p) {
    j = json{{"persistence", p.persistence}, {"severe", p.severe}};
}

void from_json(const json &j, TrustWeights &p) {
    get_if_present(j, "persistence", p.persistence);
    get_if_present(j, "severe", p.severe);
}

void to_json(json &j, const ScoringParameters &p) {
    j = json{{"anomaly_model", p.anomaly_model},
             {"severity", p.severity},
             {"explainability", p.explainability},
             {"impact_weights", p.impact_weights},
             {"policy_thresholds", p.policy_thresholds},
             {"early_warning", p.early_warning},
             {"trust_weights", p.trust_weights}};
}

void from_json(const json &j, ScoringParameters &p) {
    get_if_present(j, "anomaly_model", p.anomaly_model);
    get_if_present(j, "severity", p.severity);
    get_if_present(j, "explainability", p.explainability);
    get_if_present(j, "impact_weights", p.impact_weights);
    get_if_present(j, "policy_thresholds", p.policy_thresholds);
    get_if_present(j, "early_warning", p.early_warning);
    get_if_present(j, "trust_weights", p.trust_weights);
}

} // namespace drisk

namespace drisk::input {

void to_json(json &j, const FileInfo &p) {
    j = json{{"folder", p.folder.string()},
             {"file_pattern", p.file_pattern},
             {"delimiter", p.delimiter},
             {"date_format", p.date_format}};
}

void from_json(const json &j, OutputInfo &p) {
    get_if_present(j, "folder", p.folder);
    get_if_present(j, "report_name", p.report_name);
}

} // namespace drisk::input
