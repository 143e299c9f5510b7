#pragma once

#include <Eigen/Dense>

#include <string>
#include <vector>

namespace drisk {

/// @brief Inlier record flag value
inline constexpr int inlier_flag = 1;

/// @brief Outlier record flag value
inline constexpr int outlier_flag = -1;

/// @brief Anomaly detector output, one entry per input row
struct AnomalyResult {
    /// @brief Decision score, negative values are outliers, lower is more anomalous
    std::vector<double> scores;

    /// @brief Outlier flag, inlier_flag or outlier_flag
    std::vector<int> flags;

    /// @brief Raw score offset applied to obtain the decision scores
    double offset{};
};

/// @brief Unsupervised anomaly detector interface
class AnomalyDetector {
  public:
    /// @brief Destroys an AnomalyDetector instance
    virtual ~AnomalyDetector() = default;

    /// @brief Gets the detector name
    /// @return The human-readable detector name
    virtual std::string name() const noexcept = 0;

    /// @brief Fits the detector to a standardised matrix and scores every row
    /// @param data The standardised data, one row per record and one column per feature
    /// @param seed The random engine seed
    /// @return The score and flag of each row
    virtual AnomalyResult detect(const Eigen::MatrixXd &data, unsigned int seed) const = 0;
};

} // namespace drisk
