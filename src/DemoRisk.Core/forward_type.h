#pragma once
#include <cstdint>
#include <string>

// forward type declaration
namespace drisk::core {

/// @brief Verbosity mode enumeration
enum class VerboseMode : uint8_t {
    /// @brief only report errors
    none,

    /// @brief Print more information about actions, including warning
    verbose
};

/// @brief Enumerates the supported calendar date text layouts
enum class DateFormat : uint8_t {
    /// @brief Detect the layout from each value: ISO first, then day-first
    automatic,

    /// @brief ISO 8601 date, YYYY-MM-DD
    iso,

    /// @brief Day-first date, DD-MM-YYYY or DD/MM/YYYY
    day_first
};

class DataTable;
class DataTableColumn;
class DataTableColumnVisitor;

template <typename TYPE> class TypedDataTableColumn;

/// @brief Column of text values, e.g. names and codes
using StringDataTableColumn = TypedDataTableColumn<std::string>;

/// @brief Column of real values, e.g. features and scores
using DoubleDataTableColumn = TypedDataTableColumn<double>;

/// @brief Column of integer values, e.g. flags and counts
using IntegerDataTableColumn = TypedDataTableColumn<int>;

} // namespace drisk::core
