#include "aggregator.h"
#include "output_schema.h"
#include "policy_engine.h"
#include "table_helpers.h"

#include "DemoRisk.Core/typed_column.h"
#include "DemoRisk.Core/univariate_summary.h"

#include <algorithm>
#include <map>

namespace {

std::vector<std::size_t> severe_rows(const drisk::core::DataTable &scored) {
    const auto levels =
        drisk::column_values<drisk::core::StringDataTableColumn>(scored, drisk::columns::severity);
    auto rows = std::vector<std::size_t>{};
    for (std::size_t row = 0; row < levels.size(); row++) {
        if (drisk::parse_severity(levels[row]) == drisk::Severity::severe) {
            rows.push_back(row);
        }
    }

    return rows;
}

// Sorted by count descending, ties by label ascending
std::vector<drisk::LabelCount> count_labels(const std::vector<std::string> &labels,
                                            const std::vector<std::size_t> &rows) {
    auto counts = std::map<std::string, std::size_t>{};
    for (const auto row : rows) {
        counts[labels[row]]++;
    }

    auto result = std::vector<drisk::LabelCount>{};
    for (const auto &[label, count] : counts) {
        result.push_back(drisk::LabelCount{
            label, count, 100.0 * static_cast<double>(count) / static_cast<double>(rows.size())});
    }

    std::stable_sort(result.begin(), result.end(),
                     [](const auto &a, const auto &b) { return a.count > b.count; });
    return result;
}

} // namespace

namespace drisk {

std::size_t RunSummary::count(Severity level) const noexcept {
    return severity_counts[static_cast<std::size_t>(level)];
}

double RunSummary::percent(Severity level) const noexcept {
    if (total_records == 0) {
        return 0.0;
    }

    return 100.0 * static_cast<double>(count(level)) / static_cast<double>(total_records);
}

std::vector<DistrictRisk> Aggregator::district_ranking(const core::DataTable &scored) {
    const auto districts = column_values<core::StringDataTableColumn>(scored, columns::district);
    const auto reasons = column_values<core::StringDataTableColumn>(scored, columns::reason);
    const auto impact = column_values<core::DoubleDataTableColumn>(scored, columns::impact_score);

    struct DistrictGroup {
        core::UnivariateSummary impact;
        std::map<std::string, std::size_t> reasons;
    };

    auto groups = std::map<std::string, DistrictGroup>{};
    for (const auto row : severe_rows(scored)) {
        if (districts[row].empty()) {
            continue;
        }

        auto &group = groups[districts[row]];
        group.impact.append(impact[row]);
        group.reasons[reasons[row]]++;
    }

    auto ranking = std::vector<DistrictRisk>{};
    ranking.reserve(groups.size());
    for (const auto &[district, group] : groups) {
        // std::map is ordered, max_element keeps the first, smallest, reason among ties
        auto dominant = std::max_element(
            group.reasons.cbegin(), group.reasons.cend(),
            [](const auto &a, const auto &b) { return a.second < b.second; });

        ranking.push_back(DistrictRisk{.district = district,
                                       .severe_cases = group.impact.count_valid(),
                                       .avg_impact = group.impact.average(),
                                       .dominant_reason = dominant->first});
    }

    // Groups are already in district order, a stable sort keeps it for equal impact
    std::stable_sort(ranking.begin(), ranking.end(), [](const auto &a, const auto &b) {
        return a.avg_impact > b.avg_impact;
    });

    return ranking;
}

core::DataTable Aggregator::policy_alerts(const core::DataTable &scored) {
    const auto impact = column_values<core::DoubleDataTableColumn>(scored, columns::impact_score);
    auto rows = severe_rows(scored);
    std::stable_sort(rows.begin(), rows.end(),
                     [&impact](std::size_t a, std::size_t b) { return impact[a] > impact[b]; });

    return scored.take(rows);
}

core::DataTable Aggregator::early_warning_zones(const core::DataTable &scored) {
    const auto warnings =
        column_values<core::IntegerDataTableColumn>(scored, columns::early_warning);
    auto rows = std::vector<std::size_t>{};
    for (std::size_t row = 0; row < warnings.size(); row++) {
        if (warnings[row] != 0) {
            rows.push_back(row);
        }
    }

    return scored.take(rows);
}

RunSummary Aggregator::summarise(const core::DataTable &scored, const CleaningSummary &cleaning) {
    const auto levels = column_values<core::StringDataTableColumn>(scored, columns::severity);
    const auto warnings =
        column_values<core::IntegerDataTableColumn>(scored, columns::early_warning);
    const auto recommended =
        column_values<core::StringDataTableColumn>(scored, columns::recommended_action);

    auto summary = RunSummary{};
    summary.total_records = scored.num_rows();
    summary.cleaning = cleaning;
    for (const auto &level : levels) {
        summary.severity_counts[static_cast<std::size_t>(parse_severity(level))]++;
    }

    summary.early_warnings = static_cast<std::size_t>(
        std::count_if(warnings.cbegin(), warnings.cend(), [](int v) { return v != 0; }));

    for (const auto &action : {actions::immediate_audit, actions::targeted_investigation,
                               actions::monitor, actions::none}) {
        summary.action_counts.emplace_back(
            action, static_cast<std::size_t>(
                        std::count(recommended.cbegin(), recommended.cend(), action)));
    }

    const auto severe = severe_rows(scored);
    summary.severe_by_state = count_labels(
        column_values<core::StringDataTableColumn>(scored, columns::state), severe);
    summary.severe_by_reason = count_labels(
        column_values<core::StringDataTableColumn>(scored, columns::reason), severe);

    return summary;
}

} // namespace drisk
