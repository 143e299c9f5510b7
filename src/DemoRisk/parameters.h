#pragma once

namespace drisk {

/// @brief Isolation forest ensemble parameters
struct AnomalyModelParameters {
    /// @brief Number of trees in the ensemble
    unsigned int n_estimators{250};

    /// @brief Maximum number of rows drawn to grow each tree
    unsigned int max_samples{256};

    /// @brief Expected fraction of outliers in the data, in (0, 0.5]
    double contamination{0.01};

    /// @brief Random engine seed
    unsigned int seed{42};
};

/// @brief Severity classification parameters
struct SeverityParameters {
    /// @brief Model score percentile, in [0, 100], below which a record is severe
    double severe_percentile{1.0};
};

/// @brief Feature thresholds of the explainability rules
struct ExplainabilityThresholds {
    double youth_heavy_ratio{0.45};
    double ageing_ratio{0.10};
    double shock_score{5.0};
    double swing_fraction{0.20};
};

/// @brief Impact score components weight
struct ImpactWeights {
    double confidence{0.4};
    double persistence{0.4};
    double population{0.2};
};

/// @brief Minimum impact score, exclusive, of each recommended action
struct PolicyThresholds {
    double immediate_audit{0.85};
    double targeted_investigation{0.65};
    double monitor{0.45};
};

/// @brief Early warning voting rule parameters
struct EarlyWarningParameters {
    /// @brief Minimum number of signals to raise a warning
    int min_votes{2};

    double persistence{0.10};
    double shock_score{2.0};
    double peer_deviation{0.10};
};

/// @brief Data trust score components weight
struct TrustWeights {
    double persistence{0.5};
    double severe{0.5};
};

/// @brief The complete set of overridable scoring constants
struct ScoringParameters {
    AnomalyModelParameters anomaly_model{};
    SeverityParameters severity{};
    ExplainabilityThresholds explainability{};
    ImpactWeights impact_weights{};
    PolicyThresholds policy_thresholds{};
    EarlyWarningParameters early_warning{};
    TrustWeights trust_weights{};
};

} // namespace drisk
