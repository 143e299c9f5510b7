#include "data_config.h"

std::string test_examples_path;
std::string test_schemas_path;

std::filesystem::path default_examples_path() {
    if (!test_examples_path.empty()) {
        return test_examples_path;
    }

    return TEST_EXAMPLES_PATH;
}

std::filesystem::path default_schemas_path() {
    if (!test_schemas_path.empty()) {
        return test_schemas_path;
    }

    return TEST_SCHEMAS_PATH;
}
