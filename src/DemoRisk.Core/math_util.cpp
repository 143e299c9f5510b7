#include "math_util.h"

#include <algorithm>
#include <cmath>
#include <limits>

namespace drisk::core {

double MathHelper::round_to(double value, int decimals) noexcept {
    if (!std::isfinite(value)) {
        return value;
    }

    // nearbyint honours the default rounding mode, ties to even
    auto factor = std::pow(10.0, decimals);
    return std::nearbyint(value * factor) / factor;
}

double MathHelper::percentile(std::vector<double> values, double q) noexcept {
    if (values.empty()) {
        return std::numeric_limits<double>::quiet_NaN();
    }

    std::sort(values.begin(), values.end());
    auto rank = std::clamp(q, 0.0, 100.0) / 100.0 * static_cast<double>(values.size() - 1);
    auto lower = static_cast<std::size_t>(std::floor(rank));
    auto upper = std::min(lower + 1, values.size() - 1);
    auto fraction = rank - static_cast<double>(lower);
    return values[lower] + fraction * (values[upper] - values[lower]);
}
} // namespace drisk::core
