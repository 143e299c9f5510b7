/**
 * @file
 * @brief Checked access to the configuration JSON values, failures are printed and flagged
 */
#pragma once
#include "configuration.h"

#include <fmt/color.h>
#include <nlohmann/json.hpp>

#include <filesystem>
#include <string>

namespace drisk::input {

/// @brief Gets a required value from a JSON object
/// @param j JSON object
/// @param key The value key
/// @return The value at key
/// @throw ConfigurationError: Key not found
nlohmann::json get(const nlohmann::json &j, const std::string &key);

/// @brief Gets a value from a JSON object into out, printing the failure reason
/// @return true if the value was retrieved; otherwise, false.
template <class T> bool get_to(const nlohmann::json &j, const std::string &key, T &out) noexcept {
    const char *reason = nullptr;
    try {
        out = j.at(key).get<T>();
        return true;
    } catch (const nlohmann::json::out_of_range &) {
        reason = "is missing";
    } catch (const nlohmann::json::type_error &) {
        reason = "is of wrong type";
    }

    fmt::print(fmt::fg(fmt::color::red), "Key \"{}\" {}\n", key, reason);
    return false;
}

/// @brief Gets a value from a JSON object into out, clearing success on failure
template <class T>
bool get_to(const nlohmann::json &j, const std::string &key, T &out, bool &success) noexcept {
    if (get_to(j, key, out)) {
        return true;
    }

    success = false;
    return false;
}

/// @brief Gets an optional value, out keeps its default when the key is absent
template <class T>
void get_optional_to(const nlohmann::json &j, const std::string &key, T &out,
                     bool &success) noexcept {
    if (j.contains(key)) {
        get_to(j, key, out, success);
    }
}

/// @brief Resolves a relative path against base_dir, the result must exist
/// @param path The path to rebase, updated in place
/// @param base_dir Base directory for a relative path
/// @throw ConfigurationError: If path does not exist
void rebase_valid_path(std::filesystem::path &path, const std::filesystem::path &base_dir);

} // namespace drisk::input
