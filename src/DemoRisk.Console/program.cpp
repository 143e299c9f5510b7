#include "DemoRisk.Core/thread_util.h"
#include "DemoRisk.Input/api.h"
#include "DemoRisk/api.h"
#include "command_options.h"
#include "model_info.h"
#include "result_file_writer.h"

#include <fmt/chrono.h>
#include <fmt/color.h>

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <oneapi/tbb/global_control.h>
#include <oneapi/tbb/task_arena.h>

namespace {
constexpr std::size_t console_ranking_rows = 10;

/// @brief Get a string representation of current system time
/// @return The system time as string
std::string get_time_now_str() {
    auto tp = std::chrono::system_clock::now();
    return fmt::format("{0:%F %H:%M:}{1:%S} {0:%Z}", tp, tp.time_since_epoch());
}

/// @brief Prints application start-up messages
void print_app_title() {
    fmt::print(fmt::fg(fmt::color::yellow) | fmt::emphasis::bold,
               "\n# DemoRisk Demographic Registration Anomaly Scoring #\n\n");

    fmt::print("Today: {}\nMaximum threads: {}\n\n", get_time_now_str(),
               tbb::global_control::active_value(tbb::global_control::max_allowed_parallelism));
}

/// @brief Prints the run summary and the top of the district ranking
void print_summary(const drisk::ScoringResult &result) {
    using drisk::Severity;
    const auto &summary = result.summary;

    fmt::print(fmt::fg(fmt::color::cyan), "\n========== DEMOGRAPHIC INTELLIGENCE REPORT ==========\n");
    fmt::print("Total records analysed: {}\n", summary.total_records);
    fmt::print("Suspicious records: {} ({:.2f}%)\n", summary.count(Severity::suspicious),
               summary.percent(Severity::suspicious));
    fmt::print("Severe anomalies: {} ({:.2f}%)\n", summary.count(Severity::severe),
               summary.percent(Severity::severe));
    fmt::print("Early-warning zones: {}\n", summary.early_warnings);

    fmt::print("\nRecommended actions:\n");
    for (const auto &[action, count] : summary.action_counts) {
        fmt::print("  {:<40} {:>8}\n", action, count);
    }

    const auto rows = std::min(console_ranking_rows, result.district_ranking.size());
    fmt::print("\nTop {} of {} high-risk districts:\n", rows, result.district_ranking.size());
    for (std::size_t index = 0; index < rows; index++) {
        const auto &item = result.district_ranking[index];
        fmt::print("  {:>2}. {:<30} severe: {:>5} impact: {:>7.3f}  {}\n", index + 1,
                   item.district, item.severe_cases, item.avg_impact, item.dominant_reason);
    }
}

/// @brief Prints application exit message
/// @param exit_code The application exit code
/// @return The respective exit code
int exit_application(int exit_code) {
    fmt::print("\n\n");
    fmt::print(fmt::fg(fmt::color::yellow) | fmt::emphasis::bold, "Goodbye.");
    fmt::print(" {}.\n\n", get_time_now_str());
    return exit_code;
}
} // anonymous namespace

/// @brief DemoRisk host application entry point
/// @param argc The number of command arguments
/// @param argv The list of arguments provided
/// @return The application exit code
int main(int argc, char *argv[]) { // NOLINT(bugprone-exception-escape)
    using namespace drisk;
    using namespace drisk::input;

    // Set thread limit from OMP_THREAD_LIMIT, if set in environment.
    char *env_threads = std::getenv("OMP_THREAD_LIMIT");
    int threads =
        env_threads != nullptr ? std::atoi(env_threads) : tbb::this_task_arena::max_concurrency();
    auto thread_control = tbb::global_control(tbb::global_control::max_allowed_parallelism,
                                              static_cast<std::size_t>(std::max(threads, 1)));

    // Create CLI options and validate minimum arguments
    auto options = create_options();
    if (argc < 2) {
        std::cout << options.help() << '\n';
        return exit_application(EXIT_FAILURE);
    }

    std::optional<CommandOptions> cmd_args_opt;
    try {
        cmd_args_opt = parse_arguments(options, argc, argv);

        // We won't get a config if e.g. the user chooses the --help option
        if (!cmd_args_opt) {
            return exit_application(EXIT_SUCCESS);
        }
    } catch (const std::exception &ex) {
        fmt::print(fmt::fg(fmt::color::red), "\nInvalid command line argument: {}\n", ex.what());
        fmt::print("\n{}\n", options.help());
        return exit_application(EXIT_FAILURE);
    }

    const auto &cmd_args = cmd_args_opt.value();

    // The most restrictive of the active limits applies
    std::optional<tbb::global_control> user_thread_control;
    if (cmd_args.num_threads > 0) {
        user_thread_control.emplace(tbb::global_control::max_allowed_parallelism,
                                    cmd_args.num_threads);
    }

    print_app_title();

    // Parse inputs configuration file, *.json.
    Configuration config;
    try {
        config = get_configuration(cmd_args.config_file, cmd_args.overrides);
    } catch (const std::exception &ex) {
        fmt::print(fmt::fg(fmt::color::red), "\n\nInvalid configuration - {}.\n", ex.what());
        return exit_application(EXIT_FAILURE);
    }

    // Create output folder
    try {
        if (!std::filesystem::exists(config.output.folder)) {
            fmt::print(fmt::fg(fmt::color::dark_salmon), "\nCreating output folder: {} ...\n",
                       config.output.folder);
            std::filesystem::create_directories(config.output.folder);
        }
    } catch (const std::filesystem::filesystem_error &ex) {
        fmt::print(fmt::fg(fmt::color::red), "Failed to create output folder: {}\n", ex.what());
        return exit_application(EXIT_FAILURE);
    }

    // Load input data files into a datatable asynchronous
    auto table_future = core::run_async(load_datatable_from_csv, config.file);

#ifdef CATCH_EXCEPTIONS
    try {
#endif
        const auto run_info = RunInfo{.model = config.app_name,
                                      .version = config.app_version,
                                      .inputs = config.file,
                                      .parameters = config.parameters};
        fmt::print("Experiment: {}\n", run_info.to_string());

        const auto &model = config.parameters.anomaly_model;
        fmt::print("Anomaly model: {} trees, {} max samples, contamination: {}.\n",
                   model.n_estimators, model.max_samples, model.contamination);

        // Request input datatable instance, wait, if not completed.
        core::DataTable input_table;
        try {
            input_table = table_future.get();
        } catch (const std::exception &ex) {
            fmt::print(fmt::fg(fmt::color::red), "\nFailed to load input records: {}\n",
                       ex.what());
            return exit_application(EXIT_FAILURE);
        }

        if (config.verbosity == core::VerboseMode::verbose) {
            std::cout << input_table;
        }

        fmt::print(fmt::fg(fmt::color::cyan), "\nStarting scoring of {} records ...\n",
                   input_table.num_rows());

        auto start = std::chrono::steady_clock::now();
        ScoringResult result;
        try {
            auto pipeline =
                ScoringPipeline{config.parameters, config.date_format, config.verbosity};
            result = pipeline.run(input_table);
        } catch (const NoUsableRecordsError &ex) {
            fmt::print(fmt::fg(fmt::color::red), "\nNo usable records: {}\n", ex.what());
            return exit_application(EXIT_FAILURE);
        } catch (const std::exception &ex) {
            fmt::print(fmt::fg(fmt::color::red), "\nScoring failed: {}\n", ex.what());
            return exit_application(EXIT_FAILURE);
        }

        auto elapsed = std::chrono::duration<double, std::milli>(
                           std::chrono::steady_clock::now() - start)
                           .count();

        print_summary(result);

        try {
            auto writer =
                ResultFileWriter{config.output.folder, config.output.report_name, run_info};
            writer.write(result);
        } catch (const std::exception &ex) {
            fmt::print(fmt::fg(fmt::color::red), "\nFailed to write results: {}\n", ex.what());
            return exit_application(EXIT_FAILURE);
        }

        fmt::print(fmt::fg(fmt::color::light_green), "\nCompleted, elapsed time : {}ms\n\n",
                   elapsed);

#ifdef CATCH_EXCEPTIONS
    } catch (const std::exception &ex) {
        fmt::print(fmt::fg(fmt::color::red), "\n\nFailed with message: {}.\n\n", ex.what());

        // Rethrow exception so it can be handled by OS's default handler
        throw;
    }
#endif // CATCH_EXCEPTIONS

    return exit_application(EXIT_SUCCESS);
}

/// @brief Top-level namespace for DemoRisk Console host application
namespace drisk {}
