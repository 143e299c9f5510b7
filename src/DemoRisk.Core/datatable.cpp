#include "datatable.h"
#include "string_util.h"

#include <fmt/format.h>

#include <algorithm>
#include <stdexcept>

namespace drisk::core {

DataTable::DataTable(const DataTable &other)
    : index_{other.index_}, rows_count_{other.rows_count_} {
    columns_.reserve(other.columns_.size());
    for (const auto &col : other.columns_) {
        columns_.push_back(col->clone());
    }
}

DataTable &DataTable::operator=(const DataTable &other) {
    if (this != &other) {
        auto copy = DataTable{other};
        *this = std::move(copy);
    }

    return *this;
}

std::size_t DataTable::num_columns() const noexcept { return columns_.size(); }

std::size_t DataTable::num_rows() const noexcept { return rows_count_; }

std::vector<std::string> DataTable::names() const {
    auto result = std::vector<std::string>{};
    result.reserve(columns_.size());
    for (const auto &col : columns_) {
        result.push_back(col->name());
    }

    return result;
}

bool DataTable::contains(const std::string &name) const {
    return index_.contains(to_lower(name));
}

void DataTable::add(std::unique_ptr<DataTableColumn> column) {
    if (!columns_.empty() && column->size() != rows_count_) {
        throw std::invalid_argument(
            fmt::format("Column: {} size mismatch, expected {} rows, actual: {}.", column->name(),
                        rows_count_, column->size()));
    }

    auto [it, inserted] = index_.emplace(to_lower(column->name()), columns_.size());
    if (!inserted) {
        throw std::invalid_argument(
            fmt::format("Duplicated column name is not allowed: {}.", column->name()));
    }

    rows_count_ = column->size();
    columns_.push_back(std::move(column));
}

const DataTableColumn &DataTable::column(std::size_t index) const { return *columns_.at(index); }

const DataTableColumn &DataTable::column(const std::string &name) const {
    return *columns_[find_index(name)];
}

std::size_t DataTable::find_index(const std::string &name) const {
    auto found = index_.find(to_lower(name));
    if (found == index_.end()) {
        throw std::out_of_range(fmt::format("Column name: {} not found.", name));
    }

    return found->second;
}

DataTable DataTable::take(const std::vector<std::size_t> &indices) const {
    auto result = DataTable{};
    for (const auto &col : columns_) {
        result.add(col->take(indices));
    }

    return result;
}

std::string DataTable::to_string() const noexcept {
    auto width = std::size_t{11};
    for (const auto &col : columns_) {
        width = std::max(width, col->name().length());
    }

    auto text = fmt::format("\n Table: {} columns x {} rows\n", num_columns(), num_rows());
    text += fmt::format(" {:<{}}  {:<8}  {:>8}\n", "Column Name", width, "Type", "Nulls");
    text += fmt::format(" {:-<{}}\n", "", width + 20);
    for (const auto &col : columns_) {
        text += fmt::format(" {:<{}}  {:<8}  {:>8}\n", col->name(), width, col->type(),
                            col->null_count());
    }

    return text;
}

} // namespace drisk::core

std::ostream &operator<<(std::ostream &stream, const drisk::core::DataTable &table) {
    stream << table.to_string() << '\n';
    return stream;
}
