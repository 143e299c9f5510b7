#include "schema.h"

#include "DemoRisk.Core/exception.h"

#include <fmt/color.h>
#include <fmt/format.h>
#include <jsoncons/json.hpp>
#include <jsoncons_ext/jsonschema/jsonschema.hpp>

#include <cstring>
#include <fstream>
#include <stdexcept>

#ifdef _WIN32
#include <array>
#include <windows.h>
#endif

namespace {
using namespace jsoncons;

/// @brief Gets the directory of the running executable, the default schemas location
std::filesystem::path executable_directory() {
#if defined(_WIN32)
    std::array<wchar_t, MAX_PATH> buffer{};
    if (GetModuleFileNameW(nullptr, buffer.data(), static_cast<DWORD>(buffer.size())) == 0) {
        throw drisk::core::DemoRiskException("Could not get the executable path");
    }

    return std::filesystem::path{buffer.data()}.parent_path();
#else
    std::error_code ec;
    auto executable = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec) {
        throw drisk::core::DemoRiskException(
            fmt::format("Could not get the executable path: {}", ec.message()));
    }

    return executable.parent_path();
#endif
}

json resolve_uri(const uri &uri, const std::filesystem::path &schema_directory) {
    const auto &uri_str = uri.string();
    if (!uri_str.starts_with(drisk::input::SchemaURLPrefix)) {
        throw std::runtime_error(fmt::format("Unable to load URL: {}", uri_str));
    }

    // Strip URL prefix and load file from local filesystem
    const auto uri_path =
        std::filesystem::path{uri_str.substr(std::strlen(drisk::input::SchemaURLPrefix))};
    auto ifs = std::ifstream{schema_directory / uri_path};
    if (!ifs) {
        throw std::runtime_error(fmt::format("Failed to read schema file: {}", uri_str));
    }

    return json::parse(ifs);
}
} // anonymous namespace

namespace drisk::input {
void validate_json(std::istream &is, const std::string &schema_file_name, int schema_version,
                   const std::filesystem::path &schema_directory) {
    const auto data = json::parse(is);

    // Load schema
    const auto schema_path =
        schema_directory / fmt::format("v{}", schema_version) / schema_file_name;
    auto ifs_schema = std::ifstream{schema_path};
    if (!ifs_schema) {
        throw std::runtime_error(fmt::format("Failed to load schema: {}", schema_path.string()));
    }

    const auto resolver = [&schema_directory](const auto &uri) {
        return resolve_uri(uri, schema_directory);
    };
    const auto schema = jsonschema::make_json_schema(json::parse(ifs_schema), resolver);

    // Perform validation
    schema.validate(data);
}

nlohmann::json load_and_validate_json(const std::filesystem::path &file_path,
                                      const std::string &schema_file_name, int schema_version,
                                      bool require_schema_property,
                                      const std::filesystem::path &schema_directory) {
    auto ifs = std::ifstream{file_path};
    if (!ifs) {
        throw std::runtime_error(fmt::format("File not found: {}", file_path.string()));
    }

    auto json = nlohmann::json::parse(ifs);

    // The $schema property, when present, must match the schema version we support
    if (!json.contains("$schema")) {
        const auto message = fmt::format("File missing $schema property: {}", file_path.string());
        if (require_schema_property) {
            throw std::runtime_error(message);
        }

        fmt::print(fmt::fg(fmt::color::dark_salmon), "{}\n", message);
    } else {
        const auto actual_schema_url = json.at("$schema").get<std::string>();
        const auto expected_schema_url =
            fmt::format("{}v{}/{}", SchemaURLPrefix, schema_version, schema_file_name);
        if (actual_schema_url != expected_schema_url) {
            throw std::runtime_error(fmt::format("Invalid schema URL provided: {} (expected: {})",
                                                 actual_schema_url, expected_schema_url));
        }
    }

    // jsoncons validates its own document model, so the file is read a second time
    ifs.clear();
    ifs.seekg(0);
    auto directory = schema_directory;
    if (directory.empty()) {
        directory = executable_directory() / "schemas";
    }

    validate_json(ifs, schema_file_name, schema_version, directory);
    return json;
}
} // namespace drisk::input
