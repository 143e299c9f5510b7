#include "pch.h"

#include "DemoRisk.Core/column_builder.h"
#include "DemoRisk.Core/univariate_summary.h"
#include "DemoRisk/column_coercion.h"
#include "DemoRisk/feature_builder.h"
#include "DemoRisk/output_schema.h"
#include "DemoRisk/table_helpers.h"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

using namespace drisk;
using core::DateFormat;

namespace {

struct RawRow {
    std::string date;
    std::string state;
    std::string district;
    std::string pincode;
    std::string young;
    std::string adult;
};

core::DataTable make_raw_table(const std::vector<RawRow> &rows) {
    auto builders = std::vector<core::StringDataTableColumnBuilder>{};
    for (const auto &name : columns::required_input) {
        builders.emplace_back(name);
    }

    for (const auto &row : rows) {
        auto values = std::vector<std::string>{row.date,    row.state, row.district,
                                               row.pincode, row.young, row.adult};
        for (std::size_t i = 0; i < values.size(); i++) {
            if (values[i].empty()) {
                builders[i].append_null();
            } else {
                builders[i].append(values[i]);
            }
        }
    }

    auto table = core::DataTable{};
    for (auto &builder : builders) {
        table.add(builder.build());
    }

    return table;
}

std::chrono::year_month_day ymd(int year, unsigned month, unsigned day) {
    return std::chrono::year_month_day{std::chrono::year{year}, std::chrono::month{month},
                                       std::chrono::day{day}};
}

} // anonymous namespace

TEST(TestFeatureBuilder, ParseIsoDates) {
    EXPECT_EQ(ymd(2025, 3, 1), parse_date("2025-03-01", DateFormat::iso));
    EXPECT_EQ(ymd(2025, 3, 1), parse_date(" 2025-03-01 00:00:00", DateFormat::iso));
    EXPECT_FALSE(parse_date("01-03-2025", DateFormat::iso).has_value());
    EXPECT_FALSE(parse_date("2025-02-30", DateFormat::iso).has_value());
}

TEST(TestFeatureBuilder, ParseDayFirstDates) {
    EXPECT_EQ(ymd(2025, 3, 1), parse_date("01-03-2025", DateFormat::day_first));
    EXPECT_EQ(ymd(2025, 3, 1), parse_date("1/3/2025", DateFormat::day_first));
    EXPECT_FALSE(parse_date("2025-03-01", DateFormat::day_first).has_value());
    EXPECT_FALSE(parse_date("31-04-2025", DateFormat::day_first).has_value());
}

TEST(TestFeatureBuilder, ParseAutomaticDates) {
    EXPECT_EQ(ymd(2025, 3, 1), parse_date("2025-03-01", DateFormat::automatic));
    EXPECT_EQ(ymd(2025, 3, 1), parse_date("01-03-2025", DateFormat::automatic));
    EXPECT_FALSE(parse_date("not-a-date", DateFormat::automatic).has_value());
    EXPECT_FALSE(parse_date("", DateFormat::automatic).has_value());
}

TEST(TestFeatureBuilder, ParseNumbers) {
    EXPECT_EQ(12.0, parse_number(" 12 "));
    EXPECT_EQ(3.5, parse_number("+3.5"));
    EXPECT_FALSE(parse_number("n/a").has_value());
    EXPECT_FALSE(parse_number("").has_value());
    EXPECT_FALSE(parse_number("12abc").has_value());
}

TEST(TestFeatureBuilder, NumericCoercionLowerBound) {
    auto column = core::StringDataTableColumn{
        "counts", std::vector<std::string>{"12", "-3", "abc", "0"}};
    auto visitor = NumericCoercionVisitor{0.0};
    column.accept(visitor);
    const auto &values = visitor.values();
    ASSERT_EQ(4u, values.size());
    EXPECT_EQ(12.0, values[0]);
    EXPECT_FALSE(values[1].has_value());
    EXPECT_FALSE(values[2].has_value());
    EXPECT_EQ(0.0, values[3]);
    EXPECT_EQ(2u, visitor.invalid_count());

    auto numbers = core::IntegerDataTableColumn{"numbers", std::vector<int>{-1, 5}};
    numbers.accept(visitor);
    EXPECT_FALSE(visitor.values()[0].has_value());
    EXPECT_EQ(5.0, visitor.values()[1]);
    EXPECT_EQ(1u, visitor.invalid_count());
}

TEST(TestFeatureBuilder, RejectMissingRequiredColumn) {
    auto table = core::DataTable{};
    table.add(std::make_unique<core::StringDataTableColumn>(
        "date", std::vector<std::string>{"2025-03-01"}));
    auto builder = FeatureBuilder{};
    EXPECT_THROW((void)builder.build(table), std::out_of_range);
}

TEST(TestFeatureBuilder, CleaningFiltersInOrder) {
    auto raw = make_raw_table({
        {"2025-03-01", "Bihar", "Gaya", "823001", "20", "80"},
        {"not-a-date", "Bihar", "Gaya", "823001", "0", "0"},
        {"2025-03-02", "Bihar", "Gaya", "823001", "0", "0"},
        {"2025-03-03", "Bihar", "Gaya", "823001", "n/a", "90"},
        {"2025-03-04", "Bihar", "Gaya", "823001", "", "-5"},
    });

    auto features = FeatureBuilder{DateFormat::iso}.build(raw);
    const auto &cleaning = features.cleaning;
    EXPECT_EQ(5u, cleaning.input_rows);
    EXPECT_EQ(1u, cleaning.invalid_dates);
    EXPECT_EQ(2u, cleaning.non_positive_totals);
    EXPECT_EQ(1u, cleaning.missing_counts);
    EXPECT_EQ(2u, cleaning.retained_rows);
    ASSERT_EQ(2u, features.table.num_rows());

    const auto &young = features.table.column_as<core::DoubleDataTableColumn>(columns::age_5_17);
    EXPECT_FALSE(young.is_null(0));
    EXPECT_TRUE(young.is_null(1));

    auto totals = column_values<core::DoubleDataTableColumn>(features.table,
                                                             columns::total_population);
    EXPECT_DOUBLE_EQ(100.0, totals[0]);
    EXPECT_DOUBLE_EQ(90.0, totals[1]);
}

TEST(TestFeatureBuilder, DerivedColumnsOrder) {
    auto raw = make_raw_table({{"2025-03-01", "Bihar", "Gaya", "823001", "20", "80"}});
    auto features = FeatureBuilder{}.build(raw);
    auto names = features.table.names();
    ASSERT_EQ(10u, names.size());
    for (std::size_t i = 0; i < columns::required_input.size(); i++) {
        EXPECT_EQ(columns::required_input[i], names[i]);
    }

    for (std::size_t i = 0; i < columns::model_features.size(); i++) {
        EXPECT_EQ(columns::model_features[i], names[columns::required_input.size() + i]);
    }
}

TEST(TestFeatureBuilder, SortedByDateWithIsoText) {
    auto raw = make_raw_table({
        {"05-03-2025", "Bihar", "Gaya", "823001", "10", "90"},
        {"01-03-2025", "Bihar", "Gaya", "823001", "30", "70"},
        {"03-03-2025", "Bihar", "Patna", "800001", "25", "75"},
    });

    auto features = FeatureBuilder{DateFormat::day_first}.build(raw);
    auto dates = column_values<core::StringDataTableColumn>(features.table, columns::date);
    ASSERT_EQ(3u, dates.size());
    EXPECT_EQ("2025-03-01", dates[0]);
    EXPECT_EQ("2025-03-03", dates[1]);
    EXPECT_EQ("2025-03-05", dates[2]);
}

TEST(TestFeatureBuilder, PopulationChangeByPincode) {
    auto raw = make_raw_table({
        {"2025-03-01", "Bihar", "Gaya", "823001", "200", "800"},
        {"2025-03-02", "Bihar", "Patna", "800001", "100", "400"},
        {"2025-03-03", "Bihar", "Gaya", "823001", "300", "1000"},
        {"2025-03-04", "Bihar", "Patna", "800001", "50", "150"},
    });

    auto features = FeatureBuilder{}.build(raw);
    auto change = column_values<core::DoubleDataTableColumn>(features.table, columns::pop_change);
    ASSERT_EQ(4u, change.size());
    EXPECT_DOUBLE_EQ(0.0, change[0]);
    EXPECT_DOUBLE_EQ(0.0, change[1]);
    EXPECT_DOUBLE_EQ(300.0, change[2]);
    EXPECT_DOUBLE_EQ(-300.0, change[3]);
}

TEST(TestFeatureBuilder, YouthRatioWithinBounds) {
    auto raw = make_raw_table({
        {"2025-03-01", "Bihar", "Gaya", "823001", "80", "20"},
        {"2025-03-02", "Bihar", "Gaya", "823001", "0", "50"},
        {"2025-03-03", "Bihar", "Gaya", "823001", "40", ""},
    });

    auto features = FeatureBuilder{}.build(raw);
    auto ratio = column_values<core::DoubleDataTableColumn>(features.table, columns::youth_ratio);
    ASSERT_EQ(3u, ratio.size());
    EXPECT_DOUBLE_EQ(0.8, ratio[0]);
    EXPECT_DOUBLE_EQ(0.0, ratio[1]);
    EXPECT_DOUBLE_EQ(1.0, ratio[2]);
}

TEST(TestFeatureBuilder, NegativeCountIsMissing) {
    auto raw = make_raw_table({
        {"2025-03-01", "Bihar", "Gaya", "823001", "20", "80"},
        {"2025-03-05", "Bihar", "Gaya", "823001", "-50", "100"},
        {"2025-03-06", "Bihar", "Gaya", "823001", "30", "-200"},
    });

    auto features = FeatureBuilder{}.build(raw);
    EXPECT_EQ(2u, features.cleaning.missing_counts);
    EXPECT_EQ(0u, features.cleaning.non_positive_totals);
    ASSERT_EQ(3u, features.table.num_rows());

    const auto &young = features.table.column_as<core::DoubleDataTableColumn>(columns::age_5_17);
    EXPECT_TRUE(young.is_null(1));

    auto totals = column_values<core::DoubleDataTableColumn>(features.table,
                                                             columns::total_population);
    auto ratio = column_values<core::DoubleDataTableColumn>(features.table, columns::youth_ratio);
    EXPECT_DOUBLE_EQ(100.0, totals[1]);
    EXPECT_DOUBLE_EQ(0.0, ratio[1]);
    EXPECT_DOUBLE_EQ(30.0, totals[2]);
    EXPECT_DOUBLE_EQ(1.0, ratio[2]);
    for (const auto value : ratio) {
        EXPECT_GE(value, 0.0);
        EXPECT_LE(value, 1.0);
    }
}

TEST(TestFeatureBuilder, MissingPincodeNotChained) {
    auto raw = make_raw_table({
        {"2025-03-01", "Bihar", "Gaya", "", "100", "400"},
        {"2025-03-02", "Bihar", "Patna", "", "200", "800"},
        {"2025-03-03", "Bihar", "Gaya", "823001", "100", "400"},
        {"2025-03-04", "Bihar", "Gaya", "823001", "100", "500"},
    });

    auto features = FeatureBuilder{}.build(raw);
    auto change = column_values<core::DoubleDataTableColumn>(features.table, columns::pop_change);
    ASSERT_EQ(4u, change.size());
    EXPECT_DOUBLE_EQ(0.0, change[0]);
    EXPECT_DOUBLE_EQ(0.0, change[1]);
    EXPECT_DOUBLE_EQ(0.0, change[2]);
    EXPECT_DOUBLE_EQ(100.0, change[3]);
}

TEST(TestFeatureBuilder, ShockScoreIsStandardised) {
    auto raw = make_raw_table({
        {"2025-03-01", "Bihar", "Gaya", "823001", "100", "900"},
        {"2025-03-02", "Bihar", "Gaya", "823001", "100", "1000"},
        {"2025-03-03", "Bihar", "Gaya", "823001", "100", "1300"},
    });

    auto features = FeatureBuilder{}.build(raw);
    auto change = column_values<core::DoubleDataTableColumn>(features.table, columns::pop_change);
    auto shock = column_values<core::DoubleDataTableColumn>(features.table, columns::shock_score);
    ASSERT_EQ(3u, shock.size());

    // pop_change: 0, 100, 300; mean 400/3, sample std
    auto summary = core::UnivariateSummary{"pop_change", change};
    for (std::size_t i = 0; i < shock.size(); i++) {
        EXPECT_NEAR((change[i] - summary.average()) / summary.std_deviation(), shock[i], 1e-12);
    }

    EXPECT_LT(shock[0], 0.0);
    EXPECT_GT(shock[2], 0.0);
}

TEST(TestFeatureBuilder, ShockScoreZeroWhenDegenerate) {
    auto single = make_raw_table({{"2025-03-01", "Bihar", "Gaya", "823001", "10", "90"}});
    auto shock = column_values<core::DoubleDataTableColumn>(FeatureBuilder{}.build(single).table,
                                                            columns::shock_score);
    ASSERT_EQ(1u, shock.size());
    EXPECT_DOUBLE_EQ(0.0, shock[0]);

    auto constant = make_raw_table({
        {"2025-03-01", "Bihar", "Gaya", "823001", "10", "90"},
        {"2025-03-02", "Bihar", "Patna", "800001", "20", "80"},
    });
    shock = column_values<core::DoubleDataTableColumn>(FeatureBuilder{}.build(constant).table,
                                                       columns::shock_score);
    EXPECT_DOUBLE_EQ(0.0, shock[0]);
    EXPECT_DOUBLE_EQ(0.0, shock[1]);
}

TEST(TestFeatureBuilder, EmptyInputYieldsEmptyTable) {
    auto raw = make_raw_table({});
    auto features = FeatureBuilder{}.build(raw);
    EXPECT_EQ(0u, features.cleaning.input_rows);
    EXPECT_EQ(0u, features.table.num_rows());
    EXPECT_EQ(10u, features.table.num_columns());
}

TEST(TestTableHelpers, GroupMeanBroadcast) {
    auto keys = std::vector<std::string>{"a", "b", "a", "b", "c"};
    auto values = std::vector<double>{1.0, 10.0, 3.0, 20.0, 7.0};
    auto mean = broadcast_group_mean(keys, values);
    ASSERT_EQ(5u, mean.size());
    EXPECT_DOUBLE_EQ(2.0, mean[0]);
    EXPECT_DOUBLE_EQ(15.0, mean[1]);
    EXPECT_DOUBLE_EQ(2.0, mean[2]);
    EXPECT_DOUBLE_EQ(7.0, mean[4]);

    EXPECT_THROW((void)broadcast_group_mean(keys, {1.0}), std::invalid_argument);
}

TEST(TestTableHelpers, CompositeGroupKeys) {
    auto table = core::DataTable{};
    table.add(std::make_unique<core::StringDataTableColumn>(
        "state", std::vector<std::string>{"Bihar", "Bihar", "Goa"}));
    table.add(std::make_unique<core::StringDataTableColumn>(
        "district", std::vector<std::string>{"Gaya", "Gaya", "Gaya"}));

    auto keys = make_group_keys(table, {"state", "district"});
    ASSERT_EQ(3u, keys.size());
    EXPECT_EQ(keys[0], keys[1]);
    EXPECT_NE(keys[0], keys[2]);
}

TEST(TestTableHelpers, MissingKeyValueIsOwnGroup) {
    auto table = core::DataTable{};
    table.add(std::make_unique<core::StringDataTableColumn>(
        "district", std::vector<std::string>{"Gaya", "Gaya", "Gaya", "Gaya"}));
    table.add(std::make_unique<core::StringDataTableColumn>(
        "pincode", std::vector<std::string>{"823001", "", "", "823001"},
        std::vector<bool>{false, true, false, false}));

    auto keys = make_group_keys(table, {"district", "pincode"});
    ASSERT_EQ(4u, keys.size());
    EXPECT_EQ(keys[0], keys[3]);
    EXPECT_NE(keys[1], keys[2]);
    EXPECT_NE(keys[0], keys[1]);

    auto mean = broadcast_group_mean(keys, {0.0, 1.0, 0.0, 1.0});
    EXPECT_DOUBLE_EQ(0.5, mean[0]);
    EXPECT_DOUBLE_EQ(1.0, mean[1]);
    EXPECT_DOUBLE_EQ(0.0, mean[2]);
}
