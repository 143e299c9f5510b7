#pragma once

#include "poco.h"

#include "DemoRisk.Core/datatable.h"

#include <filesystem>
#include <string>
#include <vector>

namespace drisk::input {

/// @brief Finds the input records files in a folder
/// @param file_info The input files information
/// @return The full path of the files whose name matches the pattern, sorted by name
/// @throws std::invalid_argument if the folder does not exist.
std::vector<std::filesystem::path> find_input_files(const FileInfo &file_info);

/// @brief Reads the demographic records from a CSV file
///
/// @details The header names are trimmed and compared in lower-case, only the required
/// record columns are read, every value as a trimmed string, empty values as null.
///
/// @param file_name The CSV file full path
/// @param delimiter The data file's columns delimiter character
/// @return The records table with the required columns
/// @throws std::runtime_error for a file without every required column.
core::DataTable load_records_from_csv(const std::filesystem::path &file_name,
                                      const std::string &delimiter = ",");

/// @brief Populates a datatable with the contents of every matching input file
/// @param file_info The input files information
/// @return The concatenated records table, in file name order
/// @throws std::runtime_error if no file matches or a file misses a required column.
core::DataTable load_datatable_from_csv(const FileInfo &file_info);

} // namespace drisk::input
