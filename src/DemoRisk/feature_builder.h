#pragma once

#include "DemoRisk.Core/datatable.h"
#include "DemoRisk.Core/forward_type.h"

#include <chrono>
#include <cstddef>
#include <optional>
#include <string_view>

namespace drisk {

/// @brief Input records cleaning summary
struct CleaningSummary {
    /// @brief Number of input records
    std::size_t input_rows{};

    /// @brief Records dropped for missing or unparseable date
    std::size_t invalid_dates{};

    /// @brief Records dropped for total population less than or equal to zero
    std::size_t non_positive_totals{};

    /// @brief Retained records with at least one missing or non-numeric count
    std::size_t missing_counts{};

    /// @brief Number of records retained for scoring
    std::size_t retained_rows{};
};

/// @brief Cleaned and feature enriched records table
struct FeatureSet {
    /// @brief The records sorted by date, with the derived feature columns
    core::DataTable table;

    /// @brief The cleaning summary
    CleaningSummary cleaning;
};

/// @brief Parses a calendar date
/// @details ISO dates may carry a time of day suffix, which is ignored.
/// @param text The date text
/// @param format The expected date layout
/// @return The date, if valid; otherwise, empty.
std::optional<std::chrono::year_month_day> parse_date(std::string_view text,
                                                      core::DateFormat format) noexcept;

/// @brief Derives the per-record numeric features from the raw records
///
/// @details Drops records with invalid dates, then records with non-positive total
/// population, sorts the remaining records by date (stable) and adds the
/// @c total_population, @c youth_ratio, @c pop_change and @c shock_score columns.
/// The count columns are stored as doubles, keeping missing values as nulls.
class FeatureBuilder {
  public:
    /// @brief Initialise a new instance of the FeatureBuilder class.
    /// @param date_format The input date layout
    explicit FeatureBuilder(core::DateFormat date_format = core::DateFormat::automatic);

    /// @brief Builds the features table
    /// @param raw The raw records table with the required input columns, any column type
    /// @return The features table and the cleaning summary
    /// @throws std::out_of_range for missing required columns.
    FeatureSet build(const core::DataTable &raw) const;

  private:
    core::DateFormat date_format_;
};

} // namespace drisk
