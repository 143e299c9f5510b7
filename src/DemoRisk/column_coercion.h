#pragma once

#include "DemoRisk.Core/typed_column.h"
#include "DemoRisk.Core/visitor.h"

#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace drisk {

/// @brief Parses a decimal number, surrounding white-space is ignored
/// @param text The text to parse
/// @return The number, if the whole text is a finite number; otherwise, empty.
std::optional<double> parse_number(std::string_view text) noexcept;

/// @brief Implements a numeric coercion visitor for core::DataTable columns
///
/// @details Converts columns of any type to optional doubles, null values, text
/// that is not a number and numbers below the lower bound become empty.
class NumericCoercionVisitor : public core::DataTableColumnVisitor {
  public:
    /// @brief Initialise a new instance of the NumericCoercionVisitor class.
    /// @param lower_bound The smallest valid value
    explicit NumericCoercionVisitor(
        double lower_bound = -std::numeric_limits<double>::infinity()) noexcept;

    /// @brief Gets the coerced values of the last visited column
    /// @return The column values, empty for missing values
    const std::vector<std::optional<double>> &values() const noexcept;

    /// @brief Gets the number of non-null values not converted or below the lower bound
    /// @return The number of invalid values
    std::size_t invalid_count() const noexcept;

    void visit(const core::StringDataTableColumn &column) override;

    void visit(const core::DoubleDataTableColumn &column) override;

    void visit(const core::IntegerDataTableColumn &column) override;

  private:
    double lower_bound_;
    std::vector<std::optional<double>> values_{};
    std::size_t invalid_count_{};

    std::optional<double> check_bound(double value) noexcept;

    template <typename ColumnType> void copy_numeric(const ColumnType &column);
};

/// @brief Implements a text coercion visitor for core::DataTable columns
///
/// @details Converts columns of any type to trimmed strings, null values become empty.
class TextCoercionVisitor : public core::DataTableColumnVisitor {
  public:
    /// @brief Gets the coerced values of the last visited column
    /// @return The column values as text
    const std::vector<std::string> &values() const noexcept;

    void visit(const core::StringDataTableColumn &column) override;

    void visit(const core::DoubleDataTableColumn &column) override;

    void visit(const core::IntegerDataTableColumn &column) override;

  private:
    std::vector<std::string> values_{};

    template <typename ColumnType> void format_numeric(const ColumnType &column);
};

} // namespace drisk
