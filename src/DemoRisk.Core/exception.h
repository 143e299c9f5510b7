#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

// HACK: Clang 14 does not support std::source_location.
#if defined(__clang__) && __clang_major__ <= 14
#include <experimental/source_location>
using std::experimental::source_location;
#else
#include <source_location>
using std::source_location;
#endif // defined(__clang__) && __clang_major__ <= 14

namespace drisk::core {

/// @brief Base class of the DemoRisk run failures
///
/// @details The message is prefixed with the file and line that raised the error,
/// e.g. "scoring_pipeline.cpp:42: no usable records".
class DemoRiskException : public std::runtime_error {
  public:
    /// @brief Construct a new DemoRiskException
    /// @param message The failure description
    /// @param location Source location, defaults to the throw site
    explicit DemoRiskException(const std::string &message,
                               const source_location &location = source_location::current());

    /// @brief Gets the failure description, without the source location
    const std::string &message() const noexcept;

    /// @brief Gets the source file name of the throw site
    const std::string &file_name() const noexcept;

    /// @brief Gets the source line of the throw site
    std::uint_least32_t line() const noexcept;

  private:
    std::string message_;
    std::string file_name_;
    std::uint_least32_t line_;
};

} // namespace drisk::core
