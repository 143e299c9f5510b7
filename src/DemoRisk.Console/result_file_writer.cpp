#include "result_file_writer.h"

#include "DemoRisk.Input/jsonparser.h"
#include "DemoRisk/column_coercion.h"
#include "DemoRisk/severity.h"

#include <fmt/chrono.h>
#include <fmt/color.h>
#include <fmt/format.h>
#include <fmt/ostream.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <utility>

namespace {

constexpr std::size_t report_width = 65;

void write_label_counts(std::ostream &stream, const std::string &title,
                        const std::vector<drisk::LabelCount> &counts) {
    fmt::print(stream, "{}:\n", title);
    if (counts.empty()) {
        fmt::print(stream, "  none\n");
        return;
    }

    for (const auto &item : counts) {
        fmt::print(stream, "  {:<40} {:>8} ({:.2f}%)\n", item.label, item.count, item.percent);
    }
}

} // anonymous namespace

namespace drisk {

ResultFileWriter::ResultFileWriter(std::filesystem::path output_folder, std::string report_name,
                                   RunInfo info)
    : output_folder_{std::move(output_folder)}, report_name_{std::move(report_name)},
      info_{std::move(info)} {
    if (!std::filesystem::is_directory(output_folder_)) {
        throw std::invalid_argument(
            fmt::format("Output folder not found: {}", output_folder_.string()));
    }
}

const std::filesystem::path &ResultFileWriter::output_folder() const noexcept {
    return output_folder_;
}

void ResultFileWriter::write(const ScoringResult &result) {
    {
        auto stream = open_file(scored_data_file_name);
        write_csv(stream, result.scored);
    }
    {
        auto stream = open_file(district_ranking_file_name);
        write_csv(stream, result.district_ranking);
    }
    {
        auto stream = open_file(policy_alerts_file_name);
        write_csv(stream, result.policy_alerts);
    }
    {
        auto stream = open_file(early_warning_file_name);
        write_csv(stream, result.early_warning_zones);
    }
    {
        auto stream = open_file(report_name_);
        write_report(stream, result);
    }
    {
        auto stream = open_file(run_info_file_name);
        stream << to_json_string(result) << '\n';
    }

    fmt::print(fmt::fg(fmt::color::yellow_green), "Output files written to: {}\n",
               output_folder_.string());
}

std::ofstream ResultFileWriter::open_file(const std::string &file_name) const {
    auto file_path = output_folder_ / file_name;
    auto stream = std::ofstream{file_path, std::ofstream::out | std::ofstream::trunc};
    if (stream.fail() || !stream.is_open()) {
        throw std::runtime_error(fmt::format("Cannot open output file: {}", file_path.string()));
    }

    return stream;
}

std::string ResultFileWriter::quote_csv(const std::string &field) {
    if (field.find_first_of(",\"\r\n") == std::string::npos) {
        return field;
    }

    std::string quoted{"\""};
    for (const auto ch : field) {
        if (ch == '"') {
            quoted.push_back('"');
        }

        quoted.push_back(ch);
    }

    quoted.push_back('"');
    return quoted;
}

void ResultFileWriter::write_csv(std::ostream &stream, const core::DataTable &table) {
    const auto *sep = ",";
    auto columns = std::vector<std::vector<std::string>>{};
    columns.reserve(table.num_columns());
    auto text = TextCoercionVisitor{};
    for (auto it = table.cbegin(); it != table.cend(); ++it) {
        (*it)->accept(text);
        columns.push_back(text.values());
    }

    const auto names = table.names();
    for (std::size_t col = 0; col < names.size(); col++) {
        stream << (col > 0 ? sep : "") << quote_csv(names[col]);
    }

    stream << '\n';
    for (std::size_t row = 0; row < table.num_rows(); row++) {
        for (std::size_t col = 0; col < columns.size(); col++) {
            stream << (col > 0 ? sep : "") << quote_csv(columns[col][row]);
        }

        stream << '\n';
    }

    stream.flush();
}

void ResultFileWriter::write_csv(std::ostream &stream, const std::vector<DistrictRisk> &ranking) {
    stream << "district,severe_cases,avg_impact,dominant_reason\n";
    for (const auto &item : ranking) {
        fmt::print(stream, "{},{},{},{}\n", quote_csv(item.district), item.severe_cases,
                   item.avg_impact, quote_csv(item.dominant_reason));
    }

    stream.flush();
}

void ResultFileWriter::write_report(std::ostream &stream, const ScoringResult &result) {
    const auto &summary = result.summary;
    const auto &cleaning = summary.cleaning;

    fmt::print(stream, "DEMOGRAPHIC INTELLIGENCE REPORT\n");
    fmt::print(stream, "{:=<{}}\n\n", "", report_width);

    fmt::print(stream, "Input records: {}\n", cleaning.input_rows);
    fmt::print(stream, "  dropped, invalid date: {}\n", cleaning.invalid_dates);
    fmt::print(stream, "  dropped, non-positive total: {}\n", cleaning.non_positive_totals);
    fmt::print(stream, "  retained with missing counts: {}\n\n", cleaning.missing_counts);

    fmt::print(stream, "Total records analysed: {}\n", summary.total_records);
    for (const auto level : {Severity::normal, Severity::suspicious, Severity::severe}) {
        fmt::print(stream, "  {:<12} {:>8} ({:.2f}%)\n", to_string(level), summary.count(level),
                   summary.percent(level));
    }

    fmt::print(stream, "Severe anomalies detected: {}\n", summary.count(Severity::severe));
    fmt::print(stream, "Early-warning zones detected: {}\n\n", summary.early_warnings);

    fmt::print(stream, "Recommended actions:\n");
    for (const auto &[action, count] : summary.action_counts) {
        fmt::print(stream, "  {:<40} {:>8}\n", action, count);
    }

    fmt::print(stream, "\n");
    write_label_counts(stream, "Severe anomalies by state", summary.severe_by_state);
    fmt::print(stream, "\n");
    write_label_counts(stream, "Severe anomalies by reason", summary.severe_by_reason);

    fmt::print(stream, "\nHigh-risk districts ranked by impact:\n");
    if (result.district_ranking.empty()) {
        fmt::print(stream, "  none\n");
    } else {
        auto width = std::size_t{8};
        for (const auto &item : result.district_ranking) {
            width = std::max(width, item.district.size());
        }

        fmt::print(stream, "  {:<{}}  {:>12}  {:>10}  {}\n", "district", width, "severe_cases",
                   "avg_impact", "dominant_reason");
        for (const auto &item : result.district_ranking) {
            fmt::print(stream, "  {:<{}}  {:>12}  {:>10.3f}  {}\n", item.district, width,
                       item.severe_cases, item.avg_impact, item.dominant_reason);
        }
    }

    fmt::print(stream, "\nInterpretation:\n");
    fmt::print(stream,
               "The demographic stress observed is driven primarily by abrupt population "
               "changes and age-structure imbalance. Early-warning zones highlight regions "
               "showing emerging instability before reaching severe anomaly thresholds.\n");
    stream.flush();
}

std::string ResultFileWriter::to_json_string(const ScoringResult &result) const {
    using json = nlohmann::ordered_json;

    const auto &summary = result.summary;
    auto tp = std::chrono::system_clock::now();
    json msg = {
        {"experiment",
         {{"model", info_.model},
          {"version", info_.version},
          {"seed", info_.parameters.anomaly_model.seed},
          {"time_of_day", fmt::format("{0:%F %H:%M:}{1:%S} {0:%Z}", tp, tp.time_since_epoch())},
          {"output_folder", output_folder_.string()}}},
        {"inputs", nlohmann::json(info_.inputs)},
        {"parameters", nlohmann::json(info_.parameters)},
        {"cleaning",
         {{"input_rows", summary.cleaning.input_rows},
          {"invalid_dates", summary.cleaning.invalid_dates},
          {"non_positive_totals", summary.cleaning.non_positive_totals},
          {"missing_counts", summary.cleaning.missing_counts},
          {"retained_rows", summary.cleaning.retained_rows}}},
        {"summary",
         {{"total_records", summary.total_records},
          {"early_warnings", summary.early_warnings},
          {"policy_alerts", result.policy_alerts.num_rows()},
          {"districts_at_risk", result.district_ranking.size()}}},
    };

    for (const auto level : {Severity::normal, Severity::suspicious, Severity::severe}) {
        msg["summary"]["severity"][to_string(level)] = {{"count", summary.count(level)},
                                                        {"percent", summary.percent(level)}};
    }

    for (const auto &[action, count] : summary.action_counts) {
        msg["summary"]["actions"][action] = count;
    }

    return msg.dump(2);
}

} // namespace drisk
