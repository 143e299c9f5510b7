#pragma once

#include <algorithm>
#include <cctype>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "column.h"
#include "column_iterator.h"
#include "visitor.h"

namespace drisk::core {

/// @brief Value types a DataTable column can store
template <typename TYPE> struct ColumnTraits;

template <> struct ColumnTraits<std::string> {
    static constexpr const char *type_name = "string";
};

template <> struct ColumnTraits<double> {
    static constexpr const char *type_name = "double";
};

template <> struct ColumnTraits<int> {
    static constexpr const char *type_name = "integer";
};

/// @brief Validates a column name, at least two characters starting with a letter
/// @param name The column name
/// @throws std::invalid_argument for invalid column name
inline void validate_column_name(const std::string &name) {
    if (name.length() < 2 || !std::isalpha(static_cast<unsigned char>(name.front()))) {
        throw std::invalid_argument(
            "Invalid column name: minimum length of two and start with alpha character.");
    }
}

/// @brief DataTable column storing values of a single type with a missing values mask
/// @tparam TYPE Column value type, see ColumnTraits
template <typename TYPE> class TypedDataTableColumn final : public DataTableColumn {
  public:
    using value_type = TYPE;
    using IteratorType = DataTableColumnIterator<TypedDataTableColumn<TYPE>>;

    TypedDataTableColumn() = delete;

    /// @brief Initialises a new instance with name, data and optional null bitmap
    /// @param name Column name
    /// @param data Column data
    /// @param null_bitmap Missing values mask, true means missing, empty for no missing values
    /// @throws std::invalid_argument for invalid column name
    /// @throws std::out_of_range for data and mask size mismatch
    TypedDataTableColumn(std::string name, std::vector<TYPE> data,
                         std::vector<bool> null_bitmap = {})
        : name_{std::move(name)}, data_{std::move(data)}, null_bitmap_{std::move(null_bitmap)} {
        validate_column_name(name_);
        if (null_bitmap_.empty()) {
            null_bitmap_.assign(data_.size(), false);
        } else if (null_bitmap_.size() != data_.size()) {
            throw std::out_of_range(
                "Input vectors size mismatch, the data and null vectors size must be the same.");
        }

        null_count_ = static_cast<std::size_t>(
            std::count(null_bitmap_.begin(), null_bitmap_.end(), true));
    }

    std::string type() const noexcept override { return ColumnTraits<TYPE>::type_name; }

    const std::string &name() const noexcept override { return name_; }

    std::size_t size() const noexcept override { return data_.size(); }

    std::size_t null_count() const noexcept override { return null_count_; }

    bool is_null(std::size_t index) const noexcept override {
        return index >= data_.size() || null_bitmap_[index];
    }

    /// @brief Gets the column value at a given index
    /// @param index The row index
    /// @return The value, if inside bounds and not missing; otherwise empty
    std::optional<value_type> value_safe(std::size_t index) const {
        if (is_null(index)) {
            return std::nullopt;
        }

        return data_[index];
    }

    /// @brief Gets the column value at a given index, replacing missing with a fallback value
    /// @param index The row index
    /// @param fallback The value to return for missing or out of bounds
    /// @return The value at index, or fallback
    value_type value_or(std::size_t index, const value_type &fallback) const {
        return is_null(index) ? fallback : data_[index];
    }

    IteratorType begin() const { return IteratorType(*this); }

    IteratorType end() const { return IteratorType(*this, size()); }

    void accept(DataTableColumnVisitor &visitor) const override { visitor.visit(*this); }

    std::unique_ptr<DataTableColumn> clone() const override {
        return std::make_unique<TypedDataTableColumn<TYPE>>(*this);
    }

    std::unique_ptr<DataTableColumn> take(const std::vector<std::size_t> &indices) const override {
        auto data = std::vector<TYPE>{};
        auto nulls = std::vector<bool>{};
        data.reserve(indices.size());
        nulls.reserve(indices.size());
        for (const auto index : indices) {
            if (index >= data_.size()) {
                throw std::out_of_range("Row index outside the column range.");
            }

            data.push_back(data_[index]);
            nulls.push_back(null_bitmap_[index]);
        }

        return std::make_unique<TypedDataTableColumn<TYPE>>(name_, std::move(data),
                                                            std::move(nulls));
    }

  private:
    std::string name_;
    std::vector<TYPE> data_;
    std::vector<bool> null_bitmap_;
    std::size_t null_count_{};
};

} // namespace drisk::core
