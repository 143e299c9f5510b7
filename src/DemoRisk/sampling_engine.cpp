#include "sampling_engine.h"

#include <algorithm>
#include <limits>
#include <stdexcept>

namespace drisk {

SamplingEngine::SamplingEngine(unsigned int seed) : engine_{seed} {}

unsigned int SamplingEngine::next_seed() { return static_cast<unsigned int>(engine_()); }

std::size_t SamplingEngine::next_index(std::size_t first, std::size_t last) {
    if (last < first) {
        throw std::invalid_argument("The first index must be less than or equal to the last.");
    }

    // generate_canonical can return 1.0 on some standard libraries
    auto span = static_cast<double>(last - first) + 1.0;
    auto offset = static_cast<std::size_t>(span * next_unit());
    return std::min(first + offset, last);
}

double SamplingEngine::next_uniform(double lower, double upper) {
    return lower + (upper - lower) * next_unit();
}

double SamplingEngine::next_unit() {
    return std::generate_canonical<double, std::numeric_limits<double>::digits>(engine_);
}
} // namespace drisk
