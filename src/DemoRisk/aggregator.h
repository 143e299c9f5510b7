#pragma once

#include "feature_builder.h"
#include "severity.h"

#include "DemoRisk.Core/datatable.h"

#include <array>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace drisk {

/// @brief District ranking entry over SEVERE records
struct DistrictRisk {
    std::string district;
    std::size_t severe_cases{};
    double avg_impact{};

    /// @brief Most frequent reason, ties broken by the lexicographically smallest
    std::string dominant_reason;
};

/// @brief Number of records sharing a label and its share of the reference total
struct LabelCount {
    std::string label;
    std::size_t count{};
    double percent{};
};

/// @brief Run summary statistics
struct RunSummary {
    std::size_t total_records{};

    /// @brief Records per severity, indexed by Severity
    std::array<std::size_t, 3> severity_counts{};

    std::size_t early_warnings{};

    /// @brief Records per recommended action, in descending priority order
    std::vector<std::pair<std::string, std::size_t>> action_counts;

    /// @brief SEVERE records per state, descending count
    std::vector<LabelCount> severe_by_state;

    /// @brief SEVERE records per reason, descending count
    std::vector<LabelCount> severe_by_reason;

    CleaningSummary cleaning;

    /// @brief Gets the number of records of a severity level
    std::size_t count(Severity level) const noexcept;

    /// @brief Gets the percentage of records of a severity level
    /// @return The percentage in [0, 100], zero for no records
    double percent(Severity level) const noexcept;
};

/// @brief Read-only geography and run level views of the scored table
class Aggregator {
  public:
    Aggregator() = delete;

    /// @brief Ranks the districts with SEVERE records
    /// @param scored The scored table
    /// @return The districts by average impact descending, then name ascending
    static std::vector<DistrictRisk> district_ranking(const core::DataTable &scored);

    /// @brief Selects the SEVERE records by impact score descending, stable
    /// @param scored The scored table
    /// @return The policy alerts table, with the scored table columns
    static core::DataTable policy_alerts(const core::DataTable &scored);

    /// @brief Selects the early warning records in table order
    /// @param scored The scored table
    /// @return The early warning zones table, with the scored table columns
    static core::DataTable early_warning_zones(const core::DataTable &scored);

    /// @brief Computes the run summary statistics
    /// @param scored The scored table
    /// @param cleaning The input records cleaning summary
    /// @return The run summary
    static RunSummary summarise(const core::DataTable &scored, const CleaningSummary &cleaning);
};

} // namespace drisk
