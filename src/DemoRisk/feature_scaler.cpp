#include "feature_scaler.h"

#include "DemoRisk.Core/typed_column.h"

#include <fmt/format.h>

#include <cmath>
#include <stdexcept>

namespace drisk {

Eigen::MatrixXd make_feature_matrix(const core::DataTable &table,
                                    const std::vector<std::string> &names) {
    auto rows = static_cast<Eigen::Index>(table.num_rows());
    auto matrix = Eigen::MatrixXd(rows, static_cast<Eigen::Index>(names.size()));
    for (std::size_t col = 0; col < names.size(); col++) {
        const auto &column = table.column_as<core::DoubleDataTableColumn>(names[col]);
        for (Eigen::Index row = 0; row < rows; row++) {
            auto value = column.value_or(static_cast<std::size_t>(row), 0.0);
            matrix(row, static_cast<Eigen::Index>(col)) = std::isfinite(value) ? value : 0.0;
        }
    }

    return matrix;
}

void StandardScaler::fit(const Eigen::MatrixXd &data) {
    auto cols = data.cols();
    mean_ = Eigen::RowVectorXd::Zero(cols);
    scale_ = Eigen::RowVectorXd::Ones(cols);
    fitted_ = true;
    if (data.rows() == 0) {
        return;
    }

    mean_ = data.colwise().mean();
    Eigen::MatrixXd centred = data.rowwise() - mean_;
    Eigen::RowVectorXd variance =
        centred.array().square().colwise().sum().matrix() / static_cast<double>(data.rows());
    for (Eigen::Index col = 0; col < cols; col++) {
        auto std_dev = std::sqrt(variance(col));
        if (std_dev > 0.0) {
            scale_(col) = std_dev;
        }
    }
}

Eigen::MatrixXd StandardScaler::transform(const Eigen::MatrixXd &data) const {
    if (!fitted_) {
        throw std::invalid_argument("The scaler must be fitted before transforming data.");
    }

    if (data.cols() != mean_.cols()) {
        throw std::invalid_argument(fmt::format("Number of features mismatch: {} vs {}.",
                                                data.cols(), mean_.cols()));
    }

    Eigen::MatrixXd centred = data.rowwise() - mean_;
    return (centred.array().rowwise() / scale_.array()).matrix();
}

Eigen::MatrixXd StandardScaler::fit_transform(const Eigen::MatrixXd &data) {
    fit(data);
    return transform(data);
}

const Eigen::RowVectorXd &StandardScaler::mean() const noexcept { return mean_; }

const Eigen::RowVectorXd &StandardScaler::scale() const noexcept { return scale_; }

} // namespace drisk
