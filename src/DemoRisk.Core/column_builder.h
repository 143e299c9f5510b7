#pragma once

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "typed_column.h"

namespace drisk::core {

/// @brief Incremental builder of a typed DataTable column, one row at a time
/// @tparam TYPE Column value type
template <typename TYPE> class DataTableColumnBuilder {
  public:
    using value_type = TYPE;

    DataTableColumnBuilder() = delete;

    /// @brief Initialise a new instance of the DataTableColumnBuilder class.
    /// @param name The column name
    /// @throws std::invalid_argument for invalid column name
    explicit DataTableColumnBuilder(std::string name) : name_{std::move(name)} {
        validate_column_name(name_);
    }

    const std::string &name() const noexcept { return name_; }

    std::size_t size() const noexcept { return data_.size(); }

    std::size_t null_count() const noexcept { return null_count_; }

    void reserve(std::size_t capacity) {
        data_.reserve(capacity);
        null_bitmap_.reserve(capacity);
    }

    void append(value_type value) {
        data_.push_back(std::move(value));
        null_bitmap_.push_back(false);
    }

    void append_null() {
        data_.emplace_back();
        null_bitmap_.push_back(true);
        null_count_++;
    }

    /// @brief Builds the column with the appended rows, the builder is left empty
    /// @return The new column instance
    [[nodiscard]] std::unique_ptr<TypedDataTableColumn<TYPE>> build() {
        auto nulls = null_count_ > 0 ? std::move(null_bitmap_) : std::vector<bool>{};
        auto column = std::make_unique<TypedDataTableColumn<TYPE>>(name_, std::move(data_),
                                                                   std::move(nulls));
        data_.clear();
        null_bitmap_.clear();
        null_count_ = 0;
        return column;
    }

  private:
    std::string name_;
    std::vector<value_type> data_{};
    std::vector<bool> null_bitmap_{};
    std::size_t null_count_{};
};

using StringDataTableColumnBuilder = DataTableColumnBuilder<std::string>;

using DoubleDataTableColumnBuilder = DataTableColumnBuilder<double>;

using IntegerDataTableColumnBuilder = DataTableColumnBuilder<int>;
} // namespace drisk::core
