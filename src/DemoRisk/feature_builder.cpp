#include "feature_builder.h"
#include "column_coercion.h"
#include "output_schema.h"

#include "DemoRisk.Core/column_builder.h"
#include "DemoRisk.Core/scoped_timer.h"
#include "DemoRisk.Core/univariate_summary.h"

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <numeric>
#include <stdexcept>
#include <unordered_map>

#if USE_TIMER
#define MEASURE_FUNCTION()                                                                         \
    drisk::core::ScopedTimer timer { __func__ }
#else
#define MEASURE_FUNCTION()
#endif

namespace {

using std::chrono::year_month_day;

std::optional<int> parse_int(std::string_view text) noexcept {
    if (text.empty()) {
        return std::nullopt;
    }

    auto value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }

    return value;
}

std::optional<year_month_day> make_date(std::optional<int> year, std::optional<int> month,
                                        std::optional<int> day) noexcept {
    if (!year.has_value() || !month.has_value() || !day.has_value() || month.value() < 1 ||
        day.value() < 1) {
        return std::nullopt;
    }

    auto date = year_month_day{std::chrono::year{year.value()},
                               std::chrono::month{static_cast<unsigned>(month.value())},
                               std::chrono::day{static_cast<unsigned>(day.value())}};
    if (!date.ok()) {
        return std::nullopt;
    }

    return date;
}

// YYYY-MM-DD, optionally followed by a time of day
std::optional<year_month_day> parse_iso_date(std::string_view text) noexcept {
    if (text.size() > 10 && (text[10] == ' ' || text[10] == 'T')) {
        text = text.substr(0, 10);
    }

    if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
        return std::nullopt;
    }

    return make_date(parse_int(text.substr(0, 4)), parse_int(text.substr(5, 2)),
                     parse_int(text.substr(8, 2)));
}

// D-M-YYYY or D/M/YYYY, one or two digits day and month
std::optional<year_month_day> parse_day_first_date(std::string_view text) noexcept {
    auto first = text.find_first_of("-/");
    if (first == std::string_view::npos || first == 0 || first > 2) {
        return std::nullopt;
    }

    auto second = text.find(text[first], first + 1);
    if (second == std::string_view::npos || second - first < 2 || second - first > 3 ||
        text.size() - second != 5) {
        return std::nullopt;
    }

    return make_date(parse_int(text.substr(second + 1)),
                     parse_int(text.substr(first + 1, second - first - 1)),
                     parse_int(text.substr(0, first)));
}

std::string format_date(const year_month_day &date) {
    return fmt::format("{:04}-{:02}-{:02}", static_cast<int>(date.year()),
                       static_cast<unsigned>(date.month()), static_cast<unsigned>(date.day()));
}

} // namespace

namespace drisk {

std::optional<std::chrono::year_month_day> parse_date(std::string_view text,
                                                      core::DateFormat format) noexcept {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }

    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }

    switch (format) {
    case core::DateFormat::iso:
        return parse_iso_date(text);
    case core::DateFormat::day_first:
        return parse_day_first_date(text);
    case core::DateFormat::automatic:
        if (auto date = parse_iso_date(text); date.has_value()) {
            return date;
        }

        return parse_day_first_date(text);
    }

    return std::nullopt;
}

FeatureBuilder::FeatureBuilder(core::DateFormat date_format) : date_format_{date_format} {}

FeatureSet FeatureBuilder::build(const core::DataTable &raw) const {
    MEASURE_FUNCTION();
    for (const auto &name : columns::required_input) {
        if (!raw.contains(name)) {
            throw std::out_of_range(fmt::format("Required input column: {} not found.", name));
        }
    }

    auto text = TextCoercionVisitor{};
    raw.column(columns::date).accept(text);
    const auto date_text = text.values();
    raw.column(columns::state).accept(text);
    const auto state_text = text.values();
    raw.column(columns::district).accept(text);
    const auto district_text = text.values();
    raw.column(columns::pincode).accept(text);
    const auto pincode_text = text.values();

    // Registration counts are non-negative, a negative count is a missing count
    auto numeric = NumericCoercionVisitor{0.0};
    raw.column(columns::age_5_17).accept(numeric);
    const auto young = numeric.values();
    raw.column(columns::age_17_plus).accept(numeric);
    const auto adult = numeric.values();

    auto result = FeatureSet{};
    auto &cleaning = result.cleaning;
    cleaning.input_rows = raw.num_rows();

    // Invalid dates are dropped first, then non-positive totals
    auto kept = std::vector<std::size_t>{};
    auto days = std::vector<std::chrono::sys_days>{};
    auto dates = std::vector<year_month_day>{};
    for (std::size_t row = 0; row < raw.num_rows(); row++) {
        auto date = parse_date(date_text[row], date_format_);
        if (!date.has_value()) {
            cleaning.invalid_dates++;
            continue;
        }

        auto total = young[row].value_or(0.0) + adult[row].value_or(0.0);
        if (!(total > 0.0)) {
            cleaning.non_positive_totals++;
            continue;
        }

        if (!young[row].has_value() || !adult[row].has_value()) {
            cleaning.missing_counts++;
        }

        kept.push_back(row);
        days.emplace_back(date.value());
        dates.push_back(date.value());
    }

    cleaning.retained_rows = kept.size();

    auto order = std::vector<std::size_t>(kept.size());
    std::iota(order.begin(), order.end(), std::size_t{0});
    std::stable_sort(order.begin(), order.end(),
                     [&days](std::size_t a, std::size_t b) { return days[a] < days[b]; });

    auto date_builder = core::StringDataTableColumnBuilder{columns::date};
    auto state_builder = core::StringDataTableColumnBuilder{columns::state};
    auto district_builder = core::StringDataTableColumnBuilder{columns::district};
    auto pincode_builder = core::StringDataTableColumnBuilder{columns::pincode};
    auto young_builder = core::DoubleDataTableColumnBuilder{columns::age_5_17};
    auto adult_builder = core::DoubleDataTableColumnBuilder{columns::age_17_plus};
    auto total_population = std::vector<double>{};
    auto youth_ratio = std::vector<double>{};
    auto pop_change = std::vector<double>{};
    total_population.reserve(order.size());
    youth_ratio.reserve(order.size());
    pop_change.reserve(order.size());

    auto previous_total = std::unordered_map<std::string, double>{};
    for (const auto position : order) {
        const auto row = kept[position];
        date_builder.append(format_date(dates[position]));
        state_builder.append(state_text[row]);
        district_builder.append(district_text[row]);
        pincode_builder.append(pincode_text[row]);

        if (young[row].has_value()) {
            young_builder.append(young[row].value());
        } else {
            young_builder.append_null();
        }

        if (adult[row].has_value()) {
            adult_builder.append(adult[row].value());
        } else {
            adult_builder.append_null();
        }

        auto young_count = young[row].value_or(0.0);
        auto total = young_count + adult[row].value_or(0.0);
        total_population.push_back(total);
        youth_ratio.push_back(young_count / total);

        // Records without a pincode are not chained to any other record
        if (pincode_text[row].empty()) {
            pop_change.push_back(0.0);
            continue;
        }

        auto [previous, first_seen] = previous_total.try_emplace(pincode_text[row], total);
        pop_change.push_back(first_seen ? 0.0 : total - previous->second);
        previous->second = total;
    }

    auto summary = core::UnivariateSummary{columns::pop_change, pop_change};
    auto std_dev = summary.std_deviation();
    auto shock_score = std::vector<double>(pop_change.size(), 0.0);
    if (summary.count_valid() >= 2 && std::isfinite(std_dev) && std_dev > 0.0) {
        auto mean = summary.average();
        std::transform(pop_change.cbegin(), pop_change.cend(), shock_score.begin(),
                       [mean, std_dev](double value) { return (value - mean) / std_dev; });
    }

    auto &table = result.table;
    table.add(date_builder.build());
    table.add(state_builder.build());
    table.add(district_builder.build());
    table.add(pincode_builder.build());
    table.add(young_builder.build());
    table.add(adult_builder.build());
    table.add(std::make_unique<core::DoubleDataTableColumn>(columns::total_population,
                                                            std::move(total_population)));
    table.add(
        std::make_unique<core::DoubleDataTableColumn>(columns::youth_ratio, std::move(youth_ratio)));
    table.add(
        std::make_unique<core::DoubleDataTableColumn>(columns::pop_change, std::move(pop_change)));
    table.add(
        std::make_unique<core::DoubleDataTableColumn>(columns::shock_score, std::move(shock_score)));

    return result;
}

} // namespace drisk
