#pragma once

#include <cstddef>
#include <iterator>
#include <optional>

namespace drisk::core {

/// @brief Read-only forward iterator over a typed column, missing values are empty
/// @tparam ColumnType The typed column
template <typename ColumnType> class DataTableColumnIterator {
  public:
    using value_type = std::optional<typename ColumnType::value_type>;
    using difference_type = std::ptrdiff_t;
    using iterator_category = std::forward_iterator_tag;

    DataTableColumnIterator() = default;

    /// @brief Initialise a new instance of the DataTableColumnIterator class.
    /// @param column The column instance to iterate
    /// @param index The starting row index
    explicit DataTableColumnIterator(const ColumnType &column, std::size_t index = 0)
        : column_{&column}, index_{index} {}

    /// @brief Gets the current row index
    std::size_t index() const noexcept { return index_; }

    value_type operator*() const { return column_->value_safe(index_); }

    DataTableColumnIterator &operator++() {
        ++index_;
        return *this;
    }

    DataTableColumnIterator operator++(int) {
        auto previous = *this;
        ++index_;
        return previous;
    }

    bool operator==(const DataTableColumnIterator &other) const noexcept {
        return column_ == other.column_ && index_ == other.index_;
    }

    bool operator!=(const DataTableColumnIterator &other) const noexcept {
        return !(*this == other);
    }

  private:
    const ColumnType *column_{nullptr};
    std::size_t index_{};
};
} // namespace drisk::core
