#include "table_helpers.h"

#include "DemoRisk.Core/typed_column.h"
#include "DemoRisk.Core/univariate_summary.h"

#include <fmt/format.h>

#include <stdexcept>
#include <unordered_map>

namespace drisk {

std::vector<std::string> make_group_keys(const core::DataTable &table,
                                         const std::vector<std::string> &names) {
    constexpr auto separator = '\x1f';
    constexpr auto ungrouped = '\x1e';
    auto keys = std::vector<std::string>(table.num_rows());
    auto missing = std::vector<bool>(table.num_rows(), false);
    for (std::size_t i = 0; i < names.size(); i++) {
        const auto &column = table.column_as<core::StringDataTableColumn>(names[i]);
        for (std::size_t row = 0; row < keys.size(); row++) {
            if (i > 0) {
                keys[row].push_back(separator);
            }

            auto value = column.value_or(row, std::string{});
            missing[row] = missing[row] || value.empty();
            keys[row].append(value);
        }
    }

    // A row with a missing key value is a group of its own
    for (std::size_t row = 0; row < keys.size(); row++) {
        if (missing[row]) {
            keys[row] = fmt::format("{}{}", ungrouped, row);
        }
    }

    return keys;
}

std::vector<double> broadcast_group_mean(const std::vector<std::string> &keys,
                                         const std::vector<double> &values) {
    if (keys.size() != values.size()) {
        throw std::invalid_argument(
            fmt::format("Group keys and values size mismatch: {} vs {}.", keys.size(),
                        values.size()));
    }

    auto groups = std::unordered_map<std::string, core::UnivariateSummary>{};
    for (std::size_t row = 0; row < keys.size(); row++) {
        groups[keys[row]].append(values[row]);
    }

    auto result = std::vector<double>{};
    result.reserve(keys.size());
    for (const auto &key : keys) {
        result.push_back(groups.at(key).average());
    }

    return result;
}

} // namespace drisk
