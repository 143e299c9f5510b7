#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace drisk::core {

/// @brief Running univariate statistics of a numeric variable
///
/// @details Accumulates the exact sum for the mean and Welford's running update for the
/// variance, no data points are stored. Null values are counted, but are not included
/// in any calculation.
class UnivariateSummary {
  public:
    UnivariateSummary() = default;

    /// @brief Initialises a new instance of the UnivariateSummary class.
    /// @param name The variable name
    explicit UnivariateSummary(std::string name);

    /// @brief Initialises a new instance of the UnivariateSummary class.
    /// @param name The variable name
    /// @param values The values to summarise
    UnivariateSummary(std::string name, const std::vector<double> &values);

    const std::string &name() const noexcept;

    bool is_empty() const noexcept;

    std::size_t count_valid() const noexcept;

    std::size_t count_null() const noexcept;

    std::size_t count_total() const noexcept;

    /// @brief Gets the minimum, NaN when empty
    double min() const noexcept;

    /// @brief Gets the maximum, NaN when empty
    double max() const noexcept;

    double sum() const noexcept;

    /// @brief Gets the arithmetic mean, NaN when empty
    double average() const noexcept;

    /// @brief Gets the sample variance
    /// @return Variance value, NaN for less than two data points
    double variance() const noexcept;

    /// @brief Gets the sample standard deviation, NaN for less than two data points
    double std_deviation() const noexcept;

    void clear() noexcept;

    void append(double value) noexcept;

    /// @brief Append a data point, or a null value when empty
    void append(const std::optional<double> &option) noexcept;

    void append(const std::vector<double> &values) noexcept;

    void append_null() noexcept;

  private:
    std::string name_{"Untitled"};
    std::size_t count_{};
    std::size_t null_count_{};
    double sum_{};
    double mean_{};
    double squares_{};
    double min_{};
    double max_{};
};
} // namespace drisk::core
