#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "forward_type.h"

namespace drisk::core {

/// @brief DataTable column interface, a named vector of nullable values
class DataTableColumn {
  public:
    DataTableColumn() = default;
    DataTableColumn(const DataTableColumn &) = default;
    DataTableColumn &operator=(const DataTableColumn &) = default;
    DataTableColumn(DataTableColumn &&) = default;
    DataTableColumn &operator=(DataTableColumn &&) = default;
    virtual ~DataTableColumn() = default;

    /// @brief Gets the column value type name, e.g. "double"
    virtual std::string type() const noexcept = 0;

    /// @brief Gets the column name identifier
    virtual const std::string &name() const noexcept = 0;

    /// @brief Gets the number of rows
    virtual std::size_t size() const noexcept = 0;

    /// @brief Gets the number of missing values
    virtual std::size_t null_count() const noexcept = 0;

    /// @brief Determine whether a column value is missing
    /// @param index The row index
    /// @return true if the value is missing or the index is outside the column; otherwise, false.
    virtual bool is_null(std::size_t index) const noexcept = 0;

    /// @brief Double dispatch the column to the visitor overload for its value type
    /// @param visitor The visitor instance to accept
    virtual void accept(DataTableColumnVisitor &visitor) const = 0;

    /// @brief Creates a deep copy of this column
    virtual std::unique_ptr<DataTableColumn> clone() const = 0;

    /// @brief Creates a new column with the rows at the given indices, in the given order
    /// @param indices The zero-based row indices to take, may repeat
    /// @return A unique pointer to the new column
    /// @throws std::out_of_range for an index outside the column range.
    virtual std::unique_ptr<DataTableColumn> take(const std::vector<std::size_t> &indices) const = 0;
};
} // namespace drisk::core
