#pragma once
#include <filesystem>
#include <fstream>
#include <ostream>
#include <string>
#include <vector>

#include "DemoRisk/scoring_pipeline.h"
#include "model_info.h"

namespace drisk {

//! Fully scored records file name
inline const std::string scored_data_file_name = "full_ml_scored_data.csv";

//! District risk ranking file name
inline const std::string district_ranking_file_name = "district_risk_ranking.csv";

//! Policy alerts file name
inline const std::string policy_alerts_file_name = "top_policy_alerts.csv";

//! Early warning zones file name
inline const std::string early_warning_file_name = "early_warning_zones.csv";

//! Run information file name
inline const std::string run_info_file_name = "run_info.json";

/// @brief Defines the scoring results file writer class
///
/// The scored table and the derived views are written to CSV (Comma-separated Values)
/// files, the run summary to a plain-text report and the run information, parameters
/// and summary statistics to a JSON (JavaScript Object Notation) file, all in the same
/// output folder.
class ResultFileWriter {
  public:
    ResultFileWriter() = delete;

    /// @brief Initialises an instance of the drisk::ResultFileWriter class.
    /// @param output_folder The existing output folder
    /// @param report_name The plain-text report file name
    /// @param info The associated run information
    /// @throws std::invalid_argument if the output folder does not exist.
    ResultFileWriter(std::filesystem::path output_folder, std::string report_name, RunInfo info);

    /// @brief Writes every result file, replacing existing files
    /// @param result The scoring run results
    /// @throws std::runtime_error if a file can not be opened for writing.
    void write(const ScoringResult &result);

    /// @brief Gets the output folder
    const std::filesystem::path &output_folder() const noexcept;

    /// @brief Writes a table in CSV format, header first, null values as empty fields
    /// @param stream The output stream
    /// @param table The table to write
    static void write_csv(std::ostream &stream, const core::DataTable &table);

    /// @brief Writes the district ranking in CSV format
    /// @param stream The output stream
    /// @param ranking The district ranking
    static void write_csv(std::ostream &stream, const std::vector<DistrictRisk> &ranking);

    /// @brief Writes the plain-text demographic intelligence report
    /// @param stream The output stream
    /// @param result The scoring run results
    static void write_report(std::ostream &stream, const ScoringResult &result);

    /// @brief Quotes a CSV field, if it contains separators, quotes or line breaks
    /// @param field The field text
    /// @return The field ready to be written
    static std::string quote_csv(const std::string &field);

  private:
    std::filesystem::path output_folder_;
    std::string report_name_;
    RunInfo info_;

    std::ofstream open_file(const std::string &file_name) const;
    std::string to_json_string(const ScoringResult &result) const;
};
} // namespace drisk
