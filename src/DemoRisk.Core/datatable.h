#pragma once

#include <memory>
#include <ostream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

#include "column.h"
#include "forward_type.h"

namespace drisk::core {

/// @brief Column-oriented, append-only table of named typed columns
///
/// @details Columns can only be added, never replaced or removed, and every column
/// must have the same number of rows. Column names are case-insensitive.
class DataTable {
  public:
    /// @brief DataTable columns iterator type
    using IteratorType = std::vector<std::unique_ptr<DataTableColumn>>::const_iterator;

    DataTable() = default;

    /// @brief Deep copy, every column is cloned
    DataTable(const DataTable &other);

    /// @brief Deep copy assignment, every column is cloned
    DataTable &operator=(const DataTable &other);

    DataTable(DataTable &&other) noexcept = default;
    DataTable &operator=(DataTable &&other) noexcept = default;
    ~DataTable() = default;

    /// @brief Gets the number of columns
    /// @return Number of columns
    std::size_t num_columns() const noexcept;

    /// @brief Gets the number of rows
    /// @return Number of rows
    std::size_t num_rows() const noexcept;

    /// @brief Gets the columns name, in insertion order
    std::vector<std::string> names() const;

    /// @brief Determines whether the table has a column with a given name
    /// @param name The column name, case-insensitive
    /// @return true if the column exists; otherwise, false.
    bool contains(const std::string &name) const;

    /// @brief Adds a new column to the table
    /// @param column The column to add
    /// @throws std::invalid_argument for duplicated column name or size mismatch.
    void add(std::unique_ptr<DataTableColumn> column);

    /// @brief Gets the column at a given index
    /// @param index Column index
    /// @return The column instance
    /// @throws std::out_of_range for column index outside the range.
    const DataTableColumn &column(std::size_t index) const;

    /// @brief Gets the column by name
    /// @param name The column name
    /// @return The column instance
    /// @throws std::out_of_range for column name not found.
    const DataTableColumn &column(const std::string &name) const;

    /// @brief Gets the column by name as a specific column type
    /// @tparam ColumnType The concrete column type, e.g. DoubleDataTableColumn
    /// @param name The column name
    /// @return The typed column instance
    /// @throws std::out_of_range for column name not found.
    /// @throws std::invalid_argument for column type mismatch.
    template <typename ColumnType> const ColumnType &column_as(const std::string &name) const {
        const auto &col = column(name);
        const auto *typed = dynamic_cast<const ColumnType *>(&col);
        if (typed == nullptr) {
            throw std::invalid_argument("Column: " + name + " type mismatch, found: " + col.type());
        }

        return *typed;
    }

    /// @brief Creates a new table with the rows at the given indices, in the given order
    /// @param indices The zero-based row indices to take
    /// @return The new table with the same columns
    /// @throws std::out_of_range for a row index outside the table range.
    DataTable take(const std::vector<std::size_t> &indices) const;

    /// @brief Gets the iterator to the first column of the table.
    /// @return An iterator to the beginning
    IteratorType cbegin() const noexcept { return columns_.cbegin(); }

    /// @brief Gets the iterator element following the last column of the table.
    /// @return An iterator to the end
    IteratorType cend() const noexcept { return columns_.cend(); }

    /// @brief Creates a string representation of the DataTable structure
    /// @return The structure string representation
    std::string to_string() const noexcept;

  private:
    std::vector<std::unique_ptr<DataTableColumn>> columns_{};
    std::unordered_map<std::string, std::size_t> index_{};
    std::size_t rows_count_{};

    std::size_t find_index(const std::string &name) const;
};

} // namespace drisk::core

/// @brief Output streams operator for DataTable type.
/// @param stream The stream to output
/// @param table The DataTable instance
/// @return The output stream
std::ostream &operator<<(std::ostream &stream, const drisk::core::DataTable &table);
