#pragma once

#include <filesystem>
#include <string>

/**
 * @brief Data structures containing the configuration options
 *
 * POCO stands for "plain old class object". These structs represent data structures
 * which are contained in JSON-formatted configuration files.
 */
namespace drisk::input {

//! Default name pattern of the demographic records files
inline const std::string default_file_pattern = "api_data_aadhar_demographic_*.csv";

//! Default name of the plain-text report file
inline const std::string default_report_name = "demographic_intelligence_report.txt";

//! Information about the input records files to be loaded
struct FileInfo {
    std::filesystem::path folder;
    std::string file_pattern{default_file_pattern};
    std::string delimiter{","};
    std::string date_format{"auto"};

    auto operator<=>(const FileInfo &rhs) const = default;
};

//! Experiment output folder and report file name
struct OutputInfo {
    std::string folder;
    std::string report_name{default_report_name};

    auto operator<=>(const OutputInfo &rhs) const = default;
};

} // namespace drisk::input
