#include "configuration_parsing.h"
#include "json_access.h"
#include "jsonparser.h"

#include <fmt/color.h>
#include <stdexcept>

namespace {
using json = nlohmann::json;

/// @brief Loads the input files info, the folder must exist
drisk::input::FileInfo get_file_info(const json &node, const std::filesystem::path &base_dir) {
    using namespace drisk::input;

    auto success = true;
    auto info = FileInfo{};
    if (get_to(node, "folder", info.folder, success)) {
        try {
            rebase_valid_path(info.folder, base_dir);
        } catch (const ConfigurationError &e) {
            success = false;
            fmt::print(fmt::fg(fmt::color::red), "{}\n", e.what());
        }
    }

    get_optional_to(node, "file_pattern", info.file_pattern, success);
    get_optional_to(node, "delimiter", info.delimiter, success);
    get_optional_to(node, "date_format", info.date_format, success);
    if (!success) {
        throw ConfigurationError{"Could not load input files info"};
    }

    return info;
}
} // anonymous namespace

namespace drisk::input {

nlohmann::json get(const json &j, const std::string &key) {
    try {
        return j.at(key);
    } catch (const std::exception &) {
        fmt::print(fmt::fg(fmt::color::red), "Missing key \"{}\"\n", key);
        throw ConfigurationError{fmt::format("Missing key \"{}\"", key)};
    }
}

void rebase_valid_path(std::filesystem::path &path, const std::filesystem::path &base_dir) try {
    if (path.is_relative()) {
        path = std::filesystem::absolute(base_dir / path);
    }

    if (!std::filesystem::exists(path)) {
        throw ConfigurationError{fmt::format("Path does not exist: {}", path.string())};
    }
} catch (const std::filesystem::filesystem_error &) {
    throw ConfigurationError{fmt::format("OS error while reading path {}", path.string())};
}

void check_version(const json &j) {
    int version{};
    if (!get_to(j, "version", version)) {
        throw ConfigurationError{"File must have a schema version"};
    }

    if (version != 1) {
        throw ConfigurationError{
            fmt::format("Configuration schema version: {} mismatch, supported: 1", version)};
    }
}

void load_input_info(const json &j, Configuration &config,
                     const std::optional<std::string> &data_folder) {
    auto inputs = get(j, "inputs");
    bool success = true;

    // The command-line folder is relative to the working directory
    auto base_dir = config.root_path;
    if (data_folder.has_value()) {
        inputs["folder"] = data_folder.value();
        base_dir = std::filesystem::current_path();
    }

    try {
        config.file = get_file_info(inputs, base_dir);
    } catch (const ConfigurationError &e) {
        success = false;
        fmt::print(fmt::fg(fmt::color::red), "{}\n", e.what());
    }

    if (config.file.delimiter.size() != 1) {
        success = false;
        fmt::print(fmt::fg(fmt::color::red), "Invalid delimiter: \"{}\", must be one character\n",
                   config.file.delimiter);
    }

    try {
        config.date_format = parse_date_format(config.file.date_format);
    } catch (const ConfigurationError &e) {
        success = false;
        fmt::print(fmt::fg(fmt::color::red), "{}\n", e.what());
    }

    if (!success) {
        throw ConfigurationError{"Could not load input info"};
    }

    fmt::print("Input folder: {}, pattern: {}\n", config.file.folder.string(),
               config.file.file_pattern);
}

void load_modelling_info(const json &j, Configuration &config, std::optional<unsigned int> seed) {
    if (j.contains("modelling")) {
        try {
            j.at("modelling").get_to(config.parameters);
        } catch (const json::exception &e) {
            fmt::print(fmt::fg(fmt::color::red), "Invalid modelling section: {}\n", e.what());
            throw ConfigurationError{"Could not load modelling info"};
        }
    }

    if (seed.has_value()) {
        config.parameters.anomaly_model.seed = seed.value();
    }
}

void load_output_info(const json &j, Configuration &config,
                      const std::optional<std::string> &output_folder) {
    if (!get_to(j, "output", config.output)) {
        throw ConfigurationError{"Could not load output info"};
    }

    if (output_folder.has_value()) {
        config.output.folder = output_folder.value();
        return;
    }

    if (config.output.folder.empty()) {
        throw ConfigurationError{
            "Must specify output folder via command line argument or config file"};
    }

    auto folder = std::filesystem::path{expand_environment_variables(config.output.folder)};
    if (folder.is_relative()) {
        folder = config.root_path / folder;
    }

    config.output.folder = folder.lexically_normal().string();
}

} // namespace drisk::input
