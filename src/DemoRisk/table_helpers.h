#pragma once

#include "DemoRisk.Core/datatable.h"

#include <string>
#include <vector>

namespace drisk {

/// @brief Copies the values of a typed table column
/// @tparam ColumnType The concrete column type
/// @param table The source table
/// @param name The column name
/// @return The column values, null values are default initialised
/// @throws std::out_of_range for column name not found.
/// @throws std::invalid_argument for column type mismatch.
template <typename ColumnType>
std::vector<typename ColumnType::value_type> column_values(const core::DataTable &table,
                                                           const std::string &name) {
    const auto &column = table.column_as<ColumnType>(name);
    auto values = std::vector<typename ColumnType::value_type>{};
    values.reserve(column.size());
    for (std::size_t index = 0; index < column.size(); index++) {
        values.push_back(column.value_or(index, typename ColumnType::value_type{}));
    }

    return values;
}

/// @brief Creates the group key of each row from one or more string columns
/// @param table The source table
/// @param names The key columns name
/// @return The composite key of each row, unique for rows with a missing key value
std::vector<std::string> make_group_keys(const core::DataTable &table,
                                         const std::vector<std::string> &names);

/// @brief Computes the mean value of each group and broadcasts it back to the group rows
/// @param keys The group key of each row
/// @param values The value of each row
/// @return The group mean of each row
/// @throws std::invalid_argument for keys and values size mismatch.
std::vector<double> broadcast_group_mean(const std::vector<std::string> &keys,
                                         const std::vector<double> &values);

} // namespace drisk
