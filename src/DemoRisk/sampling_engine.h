#pragma once

#include <cstddef>
#include <random>
#include <utility>
#include <vector>

namespace drisk {

/// @brief Seeded random source for growing isolation trees
///
/// @details Wraps a 32 bit Mersenne Twister engine, the same seed always produces the
/// same sequence of draws on every platform, which keeps the anomaly scores reproducible.
class SamplingEngine {
  public:
    /// @brief Initialise a new instance of the SamplingEngine class
    /// @param seed The value to initialise the internal state
    explicit SamplingEngine(unsigned int seed);

    /// @brief Draws a seed for a dependent engine, e.g. one per tree
    /// @return The next raw value of the underlying engine
    unsigned int next_seed();

    /// @brief Draws an index uniformly from [first, last]
    /// @throws std::invalid_argument for inverted bounds.
    std::size_t next_index(std::size_t first, std::size_t last);

    /// @brief Draws a value uniformly from [lower, upper)
    double next_uniform(double lower, double upper);

    /// @brief Moves a random subset of count items to the front of the values
    ///
    /// Partial Fisher-Yates shuffle, the first count entries are drawn without replacement.
    template <typename T> void sample_front(std::vector<T> &values, std::size_t count) {
        if (values.empty()) {
            return;
        }

        const auto last = values.size() - 1;
        for (std::size_t i = 0; i < count && i <= last; i++) {
            std::swap(values[i], values[next_index(i, last)]);
        }
    }

  private:
    std::mt19937 engine_;

    double next_unit();
};
} // namespace drisk
