#include "configuration.h"
#include "configuration_parsing.h"
#include "schema.h"

#include "DemoRisk.Core/scoped_timer.h"
#include "DemoRisk.Core/string_util.h"

#include <fmt/color.h>

#include <cstdlib>
#include <exception>

#if USE_TIMER
#define MEASURE_FUNCTION()                                                                         \
    drisk::core::ScopedTimer timer { __func__ }
#else
#define MEASURE_FUNCTION()
#endif

namespace {
constexpr const char *ConfigSchemaFileName = "config.json";
constexpr int ConfigSchemaVersion = 1;
} // anonymous namespace

namespace drisk::input {

ConfigurationError::ConfigurationError(const std::string &msg) : std::runtime_error{msg} {}

Configuration get_configuration(const std::filesystem::path &config_file,
                                const ConfigurationOverrides &overrides,
                                const std::filesystem::path &schema_directory) {
    MEASURE_FUNCTION();
    bool success = true;

    Configuration config;

    // verbosity
    config.verbosity = core::VerboseMode::none;
    if (overrides.verbose) {
        config.verbosity = core::VerboseMode::verbose;
    }

    nlohmann::json opt;
    try {
        opt = load_and_validate_json(config_file, ConfigSchemaFileName, ConfigSchemaVersion,
                                     /*require_schema_property=*/false, schema_directory);
        check_version(opt);
    } catch (const ConfigurationError &) {
        throw;
    } catch (const std::exception &e) {
        throw ConfigurationError{fmt::format("Invalid configuration file: {}", e.what())};
    }

    // Base dir for relative paths
    config.root_path = std::filesystem::absolute(config_file).parent_path();

    try {
        load_input_info(opt, config, overrides.data_folder);
    } catch (const ConfigurationError &e) {
        success = false;
        fmt::print(fmt::fg(fmt::color::red), "Could not load input info: {}\n", e.what());
    }

    try {
        load_modelling_info(opt, config, overrides.seed);
    } catch (const ConfigurationError &e) {
        success = false;
        fmt::print(fmt::fg(fmt::color::red), "Could not load modelling info: {}\n", e.what());
    }

    try {
        load_output_info(opt, config, overrides.output_folder);
    } catch (const ConfigurationError &e) {
        success = false;
        fmt::print(fmt::fg(fmt::color::red), "Could not load output info: {}\n", e.what());
    }

    if (!success) {
        throw ConfigurationError{"Error loading config file"};
    }

    return config;
}

core::DateFormat parse_date_format(const std::string &name) {
    if (core::case_insensitive::equals(name, "auto")) {
        return core::DateFormat::automatic;
    }

    if (core::case_insensitive::equals(name, "iso")) {
        return core::DateFormat::iso;
    }

    if (core::case_insensitive::equals(name, "day_first")) {
        return core::DateFormat::day_first;
    }

    throw ConfigurationError{
        fmt::format("Unknown date format: {}, expected: auto, iso or day_first", name)};
}

std::string expand_environment_variables(const std::string &path) {
    if (path.find("${") == std::string::npos) {
        return path;
    }

    std::string pre = path.substr(0, path.find("${"));
    std::string post = path.substr(path.find("${") + 2);
    if (post.find('}') == std::string::npos) {
        return path;
    }

    std::string variable = post.substr(0, post.find('}'));
    std::string value;

    post = post.substr(post.find('}') + 1);
    if (const char *v = std::getenv(variable.c_str())) { // C4996, but safe here.
        value = v;
    }

    return expand_environment_variables(pre + value + post);
}

} // namespace drisk::input
