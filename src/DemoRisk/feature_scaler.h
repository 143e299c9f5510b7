#pragma once

#include "DemoRisk.Core/datatable.h"

#include <Eigen/Dense>

#include <string>
#include <vector>

namespace drisk {

/// @brief Creates a dense matrix from numeric table columns
/// @details Null and non-finite values are replaced by zero.
/// @param table The source table
/// @param names The columns to include, in matrix column order
/// @return The matrix, one row per table row
/// @throws std::out_of_range for a missing column.
/// @throws std::invalid_argument for a non-double column.
Eigen::MatrixXd make_feature_matrix(const core::DataTable &table,
                                    const std::vector<std::string> &names);

/// @brief Standardise features by removing the mean and scaling to unit population variance
class StandardScaler {
  public:
    /// @brief Computes the mean and standard deviation of each column
    /// @param data The data to fit, one row per observation
    void fit(const Eigen::MatrixXd &data);

    /// @brief Standardises the data with the fitted mean and scale
    /// @param data The data to transform
    /// @return The standardised data
    /// @throws std::invalid_argument if not fitted or the number of columns differs.
    Eigen::MatrixXd transform(const Eigen::MatrixXd &data) const;

    /// @brief Fit to data, then transform it
    /// @param data The data to fit and transform
    /// @return The standardised data
    Eigen::MatrixXd fit_transform(const Eigen::MatrixXd &data);

    /// @brief Gets the fitted columns mean
    const Eigen::RowVectorXd &mean() const noexcept;

    /// @brief Gets the fitted columns scale, one for zero variance columns
    const Eigen::RowVectorXd &scale() const noexcept;

  private:
    Eigen::RowVectorXd mean_{};
    Eigen::RowVectorXd scale_{};
    bool fitted_{false};
};

} // namespace drisk
