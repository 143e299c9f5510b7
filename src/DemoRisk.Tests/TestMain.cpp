#include "data_config.h"
#include "pch.h"

#include <cxxopts.hpp>
#include <filesystem>
#include <iostream>

cxxopts::Options create_options() {
    cxxopts::Options options("DemoRisk.Tests", "DemoRisk anomaly scoring test.");
    options.add_options()("e,examples", "Path to the example configuration folder.",
                          cxxopts::value<std::string>())(
        "s,schemas", "Path to the JSON schemas folder.", cxxopts::value<std::string>())(
        "help", "Help about this test application.");

    return options;
}

// NOLINTNEXTLINE(bugprone-exception-escape)
int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);

    std::cout << "\nInitialising with a custom GTest main function.\n\n";

    auto options = create_options();
    options.allow_unrecognised_options();
    auto result = options.parse(argc, argv);
    if (result.count("help")) {
        std::cout << options.help() << '\n';
        return EXIT_SUCCESS;
    }

    auto examples_path = std::filesystem::path{TEST_EXAMPLES_PATH};
    if (result.count("examples")) {
        examples_path = std::filesystem::absolute(result["examples"].as<std::string>());
    } else {
        std::cout << "Using default example folder ...\n\n";
    }

    if (result.count("schemas")) {
        test_schemas_path =
            std::filesystem::absolute(result["schemas"].as<std::string>()).string();
    }

    std::cout << "Test location..: " << std::filesystem::current_path().string() << "\n";
    if (std::filesystem::exists(examples_path)) {
        std::cout << "Example folder.: " << examples_path.string() << "\n\n";
        test_examples_path = examples_path.string();
    } else {
        std::cerr << "Example folder.: " << examples_path.string() << " *** not found ***.\n\n";
    }

    return RUN_ALL_TESTS();
}
