#include "pch.h"

#include "DemoRisk.Core/api.h"

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace drisk::core;

namespace {
DataTable create_test_table() {
    auto table = DataTable{};
    table.add(std::make_unique<StringDataTableColumn>(
        "district", std::vector<std::string>{"Gaya", "Patna", "Pune"}));
    table.add(std::make_unique<DoubleDataTableColumn>(
        "youth_ratio", std::vector<double>{0.25, 0.5, 0.0}, std::vector<bool>{false, false, true}));
    table.add(std::make_unique<IntegerDataTableColumn>("total_population",
                                                       std::vector<int>{120, 80, 300}));
    return table;
}
} // anonymous namespace

TEST(TestCoreDataTable, CreateEmpty) {
    auto table = DataTable{};
    EXPECT_EQ(0u, table.num_columns());
    EXPECT_EQ(0u, table.num_rows());
    EXPECT_TRUE(table.names().empty());
}

TEST(TestCoreDataTable, AddColumnsKeepsOrder) {
    auto table = create_test_table();
    ASSERT_EQ(3u, table.num_columns());
    ASSERT_EQ(3u, table.num_rows());

    auto names = table.names();
    EXPECT_EQ("district", names[0]);
    EXPECT_EQ("youth_ratio", names[1]);
    EXPECT_EQ("total_population", names[2]);
    EXPECT_EQ("integer", table.column(2).type());
}

TEST(TestCoreDataTable, ColumnNameIsCaseInsensitive) {
    auto table = create_test_table();
    EXPECT_TRUE(table.contains("District"));
    EXPECT_TRUE(table.contains("YOUTH_RATIO"));
    EXPECT_FALSE(table.contains("pincode"));
    EXPECT_EQ("string", table.column("DISTRICT").type());
    EXPECT_EQ("total_population", table.column("Total_Population").name());
}

TEST(TestCoreDataTable, RejectDuplicateColumnName) {
    auto table = create_test_table();
    EXPECT_THROW(table.add(std::make_unique<StringDataTableColumn>(
                     "District", std::vector<std::string>{"a", "b", "c"})),
                 std::invalid_argument);
}

TEST(TestCoreDataTable, RejectColumnSizeMismatch) {
    auto table = create_test_table();
    EXPECT_THROW(
        table.add(std::make_unique<DoubleDataTableColumn>("pop_change", std::vector<double>{1.0})),
        std::invalid_argument);
}

TEST(TestCoreDataTable, AccessMissingColumnThrows) {
    auto table = create_test_table();
    EXPECT_THROW(table.column("state"), std::out_of_range);
    EXPECT_THROW(table.column(5), std::out_of_range);
}

TEST(TestCoreDataTable, TypedColumnAccess) {
    auto table = create_test_table();
    const auto &ratio = table.column_as<DoubleDataTableColumn>("youth_ratio");
    EXPECT_DOUBLE_EQ(0.5, ratio.value_or(1, -1.0));
    EXPECT_DOUBLE_EQ(-1.0, ratio.value_or(2, -1.0));
    EXPECT_TRUE(ratio.is_null(2));
    EXPECT_FALSE(ratio.value_safe(2).has_value());
    EXPECT_EQ(1u, ratio.null_count());

    EXPECT_THROW((void)table.column_as<IntegerDataTableColumn>("youth_ratio"),
                 std::invalid_argument);
}

TEST(TestCoreDataTable, TakeRowsByIndex) {
    auto table = create_test_table();
    auto subset = table.take({2, 0});
    ASSERT_EQ(3u, subset.num_columns());
    ASSERT_EQ(2u, subset.num_rows());

    const auto &district = subset.column_as<StringDataTableColumn>("district");
    EXPECT_EQ("Pune", district.value_or(0, ""));
    EXPECT_EQ("Gaya", district.value_or(1, ""));

    const auto &ratio = subset.column_as<DoubleDataTableColumn>("youth_ratio");
    EXPECT_TRUE(ratio.is_null(0));
    EXPECT_FALSE(ratio.is_null(1));

    EXPECT_THROW((void)table.take({0, 7}), std::out_of_range);
}

TEST(TestCoreDataTable, CopyIsIndependent) {
    auto table = create_test_table();
    auto copy = table;
    copy.add(std::make_unique<DoubleDataTableColumn>("pop_change",
                                                     std::vector<double>{0.0, 1.0, 2.0}));
    EXPECT_EQ(3u, table.num_columns());
    EXPECT_EQ(4u, copy.num_columns());
}

TEST(TestCoreDataTable, ColumnIteratorYieldsOptionals) {
    auto table = create_test_table();
    const auto &ratio = table.column_as<DoubleDataTableColumn>("youth_ratio");
    auto valid = 0;
    for (const auto &item : ratio) {
        if (item.has_value()) {
            valid++;
        }
    }

    EXPECT_EQ(2, valid);
}

TEST(TestCoreDataTable, PrintTableSummary) {
    auto table = create_test_table();
    auto text = table.to_string();
    EXPECT_NE(std::string::npos, text.find("Table: 3 columns x 3 rows"));
    EXPECT_NE(std::string::npos, text.find("youth_ratio"));
}

TEST(TestCoreColumnBuilder, BuildWithNulls) {
    auto builder = DoubleDataTableColumnBuilder{"shock_score"};
    builder.reserve(3);
    builder.append(1.5);
    builder.append_null();
    builder.append(-2.0);
    EXPECT_EQ(3u, builder.size());
    EXPECT_EQ(1u, builder.null_count());

    auto column = builder.build();
    EXPECT_EQ("shock_score", column->name());
    EXPECT_EQ(3u, column->size());
    EXPECT_EQ(1u, column->null_count());
    EXPECT_TRUE(column->is_null(1));
    EXPECT_DOUBLE_EQ(-2.0, column->value_or(2, 0.0));
}

TEST(TestCoreColumnBuilder, BuildWithoutNulls) {
    auto builder = StringDataTableColumnBuilder{"state"};
    builder.append("Bihar");
    builder.append("Maharashtra");

    auto column = builder.build();
    EXPECT_EQ(0u, column->null_count());
    EXPECT_EQ("Maharashtra", column->value_or(1, ""));
}

TEST(TestCoreColumnBuilder, RejectInvalidName) {
    EXPECT_THROW(IntegerDataTableColumnBuilder{"x"}, std::invalid_argument);
    EXPECT_THROW(IntegerDataTableColumnBuilder{"1st"}, std::invalid_argument);
    EXPECT_THROW(StringDataTableColumn("", std::vector<std::string>{}), std::invalid_argument);
    EXPECT_THROW(DoubleDataTableColumn("ratio", std::vector<double>{1.0, 2.0}, {true}),
                 std::out_of_range);
}

TEST(TestCoreColumnBuilder, BuildLeavesBuilderEmpty) {
    auto builder = IntegerDataTableColumnBuilder{"ml_flag"};
    builder.append(1);
    builder.append(-1);

    auto first = builder.build();
    EXPECT_EQ(2u, first->size());
    EXPECT_EQ(0u, builder.size());
    EXPECT_EQ("ml_flag", builder.name());

    builder.append_null();
    auto second = builder.build();
    EXPECT_EQ(1u, second->size());
    EXPECT_EQ(1u, second->null_count());
}
