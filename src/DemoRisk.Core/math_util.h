#pragma once

#include <vector>

namespace drisk::core {

/// @brief Numerical helpers shared by the scoring stages
class MathHelper {
  public:
    MathHelper() = delete;

    /// @brief Rounds a value to a number of decimal places, half-way cases to even.
    /// @param value The value to round
    /// @param decimals Number of decimal places
    /// @return The rounded value, non-finite values are returned unchanged
    static double round_to(double value, int decimals) noexcept;

    /// @brief Computes the q-th percentile of the data using linear interpolation
    ///        between the closest ranks.
    /// @param values The data values, any order
    /// @param q The percentile, clamped to the range [0, 100]
    /// @return The percentile value, NaN for empty data.
    static double percentile(std::vector<double> values, double q) noexcept;
};
} // namespace drisk::core
