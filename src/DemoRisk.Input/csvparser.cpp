#include "csvparser.h"
#include <rapidcsv.h>

#include "DemoRisk.Core/column_builder.h"
#include "DemoRisk.Core/scoped_timer.h"
#include "DemoRisk.Core/string_util.h"
#include "DemoRisk/output_schema.h"

#include <fmt/color.h>

#include <algorithm>
#include <array>
#include <iterator>
#include <map>
#include <stdexcept>
#include <type_traits>

#if USE_TIMER
#define MEASURE_FUNCTION()                                                                         \
    drisk::core::ScopedTimer timer { __func__ }
#else
#define MEASURE_FUNCTION()
#endif

namespace {

namespace dc = drisk::core;

using RecordColumns =
    std::array<std::vector<std::string>,
               std::tuple_size_v<std::remove_cvref_t<decltype(drisk::columns::required_input)>>>;

void append_records(const std::filesystem::path &file_name, const std::string &delimiter,
                    RecordColumns &columns) {
    using namespace rapidcsv;
    if (delimiter.size() != 1) {
        throw std::invalid_argument(
            fmt::format("Invalid delimiter: \"{}\", must be one character.", delimiter));
    }

    Document doc{file_name.string(), LabelParams{}, SeparatorParams{delimiter.front()}};

    // Normalised header name to file header name
    std::map<std::string, std::string> headers;
    for (const auto &header : doc.GetColumnNames()) {
        headers.emplace(dc::to_lower(dc::trim(header)), header);
    }

    bool success = true;
    for (const auto &name : drisk::columns::required_input) {
        if (!headers.contains(name)) {
            success = false;
            fmt::print(fmt::fg(fmt::color::dark_salmon), "Column: {} not found in file: {}.\n",
                       name, file_name.filename().string());
        }
    }

    if (!success) {
        throw std::runtime_error(
            fmt::format("Required columns not found in file: {}.", file_name.string()));
    }

    for (std::size_t index = 0; index < columns.size(); index++) {
        auto data = doc.GetColumn<std::string>(headers.at(drisk::columns::required_input[index]));
        auto &target = columns[index];
        target.insert(target.end(), std::make_move_iterator(data.begin()),
                      std::make_move_iterator(data.end()));
    }
}

dc::DataTable build_table(const RecordColumns &columns) {
    dc::DataTable table;
    for (std::size_t index = 0; index < columns.size(); index++) {
        auto builder = dc::StringDataTableColumnBuilder{drisk::columns::required_input[index]};
        builder.reserve(columns[index].size());
        for (const auto &value : columns[index]) {
            auto str = dc::trim(value);
            if (str.length() > 0) {
                builder.append(str);
                continue;
            }

            builder.append_null();
        }

        table.add(builder.build());
    }

    return table;
}

} // anonymous namespace

namespace drisk::input {

std::vector<std::filesystem::path> find_input_files(const FileInfo &file_info) {
    namespace fs = std::filesystem;
    if (!fs::is_directory(file_info.folder)) {
        throw std::invalid_argument(
            fmt::format("Input folder not found: {}", file_info.folder.string()));
    }

    std::vector<fs::path> files;
    for (const auto &entry : fs::directory_iterator{file_info.folder}) {
        if (entry.is_regular_file() &&
            core::wildcard_match(entry.path().filename().string(), file_info.file_pattern)) {
            files.push_back(entry.path());
        }
    }

    std::sort(files.begin(), files.end());
    return files;
}

core::DataTable load_records_from_csv(const std::filesystem::path &file_name,
                                      const std::string &delimiter) {
    auto columns = RecordColumns{};
    append_records(file_name, delimiter, columns);
    return build_table(columns);
}

core::DataTable load_datatable_from_csv(const FileInfo &file_info) {
    MEASURE_FUNCTION();
    const auto files = find_input_files(file_info);
    if (files.empty()) {
        throw std::runtime_error(fmt::format("No input file matching: {} found in folder: {}",
                                             file_info.file_pattern, file_info.folder.string()));
    }

    auto columns = RecordColumns{};
    for (const auto &file : files) {
        append_records(file, file_info.delimiter, columns);
    }

    auto table = build_table(columns);
    fmt::print("Loaded {} records from {} files.\n", table.num_rows(), files.size());
    return table;
}

} // namespace drisk::input
