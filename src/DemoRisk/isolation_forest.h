#pragma once

#include "anomaly_detector.h"
#include "parameters.h"

#include <cstddef>
#include <vector>

namespace drisk {

/// @brief Isolation forest anomaly detector
///
/// @details Grows an ensemble of random partitioning trees, each on a subsample of rows
/// drawn without replacement, and scores rows by their average isolation path length:
/// <c>score = -2^(-E[h(x)] / c(psi))</c>. The decision score subtracts the contamination
/// percentile of the raw scores, rows with negative decision score are outliers.
///
/// Trees are grown and rows scored in parallel, each tree owns its random engine
/// seeded from a sequence drawn upfront, results are reproducible for a given seed.
class IsolationForest final : public AnomalyDetector {
  public:
    IsolationForest() = delete;

    /// @brief Initialise a new instance of the IsolationForest class.
    /// @param n_estimators Number of trees in the ensemble
    /// @param max_samples Maximum number of rows drawn to grow each tree
    /// @param contamination Expected fraction of outliers, in (0, 0.5]
    /// @throws std::invalid_argument for invalid parameter values.
    IsolationForest(unsigned int n_estimators, unsigned int max_samples, double contamination);

    /// @brief Initialise a new instance of the IsolationForest class.
    /// @param parameters The anomaly model parameters, the seed is ignored
    /// @throws std::invalid_argument for invalid parameter values.
    explicit IsolationForest(const AnomalyModelParameters &parameters);

    std::string name() const noexcept override;

    AnomalyResult detect(const Eigen::MatrixXd &data, unsigned int seed) const override;

    /// @brief Gets the number of trees in the ensemble
    unsigned int n_estimators() const noexcept;

    /// @brief Gets the maximum number of rows drawn to grow each tree
    unsigned int max_samples() const noexcept;

    /// @brief Gets the expected fraction of outliers
    double contamination() const noexcept;

    /// @brief Average path length of an unsuccessful binary search tree search
    /// @param size The number of items in the tree
    /// @return The average path length, zero for one or no items.
    static double average_path_length(std::size_t size) noexcept;

  private:
    /// @brief Flat tree node, leaf nodes have a negative feature index
    struct Node {
        int feature{-1};
        double threshold{};
        int left{-1};
        int right{-1};
        std::size_t size{};
    };

    using Tree = std::vector<Node>;

    unsigned int n_estimators_;
    unsigned int max_samples_;
    double contamination_;

    Tree grow_tree(const Eigen::MatrixXd &data, unsigned int seed, std::size_t sample_size,
                   int height_limit) const;

    static double path_length(const Tree &tree, const Eigen::MatrixXd &data, Eigen::Index row);
};

} // namespace drisk
