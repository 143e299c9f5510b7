#include "pch.h"
#include "temp_dir.h"

#include "DemoRisk.Console/result_file_writer.h"
#include "DemoRisk.Core/typed_column.h"
#include "DemoRisk/policy_engine.h"

#include <nlohmann/json.hpp>

#include <fstream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace drisk;

namespace {

ScoringResult create_test_result() {
    auto result = ScoringResult{};
    result.scored.add(std::make_unique<core::StringDataTableColumn>(
        "district", std::vector<std::string>{"Gaya", "Patna, East"}));
    result.scored.add(std::make_unique<core::DoubleDataTableColumn>(
        "impact_score", std::vector<double>{1.25, 0.5}, std::vector<bool>{false, true}));
    result.scored.add(
        std::make_unique<core::IntegerDataTableColumn>("early_warning", std::vector<int>{0, 1}));

    result.policy_alerts = result.scored.take({0});
    result.early_warning_zones = result.scored.take({1});
    result.district_ranking.push_back(DistrictRisk{.district = "Gaya",
                                                   .severe_cases = 1,
                                                   .avg_impact = 1.25,
                                                   .dominant_reason = "Youth-heavy population"});

    auto &summary = result.summary;
    summary.total_records = 2;
    summary.severity_counts = {0, 1, 1};
    summary.early_warnings = 1;
    summary.action_counts = {{actions::immediate_audit, 1},
                             {actions::targeted_investigation, 0},
                             {actions::monitor, 0},
                             {actions::none, 1}};
    summary.severe_by_state = {LabelCount{"Bihar", 1, 100.0}};
    summary.severe_by_reason = {LabelCount{"Youth-heavy population", 1, 100.0}};
    summary.cleaning = CleaningSummary{.input_rows = 4,
                                       .invalid_dates = 1,
                                       .non_positive_totals = 1,
                                       .missing_counts = 0,
                                       .retained_rows = 2};
    return result;
}

RunInfo create_run_info() {
    return RunInfo{.model = "DemoRisk",
                   .version = "1.0.0",
                   .inputs = input::FileInfo{.folder = "data", .file_pattern = "*.csv"},
                   .parameters = ScoringParameters{}};
}

std::string read_file(const std::filesystem::path &file_path) {
    auto ifs = std::ifstream{file_path};
    auto ss = std::stringstream{};
    ss << ifs.rdbuf();
    return ss.str();
}

} // anonymous namespace

TEST(TestResultFileWriter, QuoteCsvFields) {
    EXPECT_EQ("Gaya", ResultFileWriter::quote_csv("Gaya"));
    EXPECT_EQ("\"Patna, East\"", ResultFileWriter::quote_csv("Patna, East"));
    EXPECT_EQ("\"say \"\"hi\"\"\"", ResultFileWriter::quote_csv("say \"hi\""));
    EXPECT_EQ("\"two\nlines\"", ResultFileWriter::quote_csv("two\nlines"));
    EXPECT_EQ("", ResultFileWriter::quote_csv(""));
}

TEST(TestResultFileWriter, WriteTableAsCsv) {
    auto result = create_test_result();
    auto stream = std::stringstream{};
    ResultFileWriter::write_csv(stream, result.scored);

    EXPECT_EQ("district,impact_score,early_warning\n"
              "Gaya,1.25,0\n"
              "\"Patna, East\",,1\n",
              stream.str());
}

TEST(TestResultFileWriter, WriteRankingAsCsv) {
    auto result = create_test_result();
    auto stream = std::stringstream{};
    ResultFileWriter::write_csv(stream, result.district_ranking);

    EXPECT_EQ("district,severe_cases,avg_impact,dominant_reason\n"
              "Gaya,1,1.25,Youth-heavy population\n",
              stream.str());
}

TEST(TestResultFileWriter, WriteReport) {
    auto stream = std::stringstream{};
    ResultFileWriter::write_report(stream, create_test_result());
    auto report = stream.str();

    EXPECT_EQ(0u, report.find("DEMOGRAPHIC INTELLIGENCE REPORT"));
    EXPECT_NE(std::string::npos, report.find("Total records analysed: 2"));
    EXPECT_NE(std::string::npos, report.find("Severe anomalies detected: 1"));
    EXPECT_NE(std::string::npos, report.find("Early-warning zones detected: 1"));
    EXPECT_NE(std::string::npos, report.find("dropped, invalid date: 1"));
    EXPECT_NE(std::string::npos, report.find(actions::immediate_audit));
    EXPECT_NE(std::string::npos, report.find("Severe anomalies by state"));
    EXPECT_NE(std::string::npos, report.find("Bihar"));
    EXPECT_NE(std::string::npos, report.find("High-risk districts ranked by impact"));
    EXPECT_NE(std::string::npos, report.find("Interpretation:"));
}

TEST(TestResultFileWriter, RejectMissingFolder) {
    auto dir = TempDir{};
    EXPECT_THROW(ResultFileWriter(dir.path() / "missing", "report.txt", create_run_info()),
                 std::invalid_argument);
}

TEST(TestResultFileWriter, WriteAllFiles) {
    auto dir = TempDir{};
    auto writer = ResultFileWriter{dir.path(), "report.txt", create_run_info()};
    EXPECT_EQ(dir.path(), writer.output_folder());

    writer.write(create_test_result());
    for (const auto &name : {scored_data_file_name, district_ranking_file_name,
                             policy_alerts_file_name, early_warning_file_name, run_info_file_name,
                             std::string{"report.txt"}}) {
        EXPECT_TRUE(std::filesystem::exists(dir.path() / name)) << name;
    }

    auto alerts = read_file(dir.path() / policy_alerts_file_name);
    EXPECT_EQ("district,impact_score,early_warning\nGaya,1.25,0\n", alerts);

    auto info = nlohmann::json::parse(read_file(dir.path() / run_info_file_name));
    EXPECT_EQ("DemoRisk", info["experiment"]["model"].get<std::string>());
    EXPECT_EQ(42u, info["experiment"]["seed"].get<unsigned int>());
    EXPECT_EQ("*.csv", info["inputs"]["file_pattern"].get<std::string>());
    EXPECT_EQ(",", info["inputs"]["delimiter"].get<std::string>());
    EXPECT_EQ(250u, info["parameters"]["anomaly_model"]["n_estimators"].get<unsigned int>());
    EXPECT_EQ(4u, info["cleaning"]["input_rows"].get<std::size_t>());
    EXPECT_EQ(1u, info["summary"]["severity"]["SEVERE"]["count"].get<std::size_t>());
    EXPECT_DOUBLE_EQ(50.0, info["summary"]["severity"]["SEVERE"]["percent"].get<double>());
    EXPECT_EQ(1u, info["summary"]["actions"][actions::none].get<std::size_t>());
}
