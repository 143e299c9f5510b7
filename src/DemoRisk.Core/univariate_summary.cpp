#include "univariate_summary.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <utility>

namespace {
constexpr double not_a_number = std::numeric_limits<double>::quiet_NaN();
} // namespace

namespace drisk::core {

UnivariateSummary::UnivariateSummary(std::string name) : name_{std::move(name)} {}

UnivariateSummary::UnivariateSummary(std::string name, const std::vector<double> &values)
    : name_{std::move(name)} {
    append(values);
}

const std::string &UnivariateSummary::name() const noexcept { return name_; }

bool UnivariateSummary::is_empty() const noexcept { return count_ == 0; }

std::size_t UnivariateSummary::count_valid() const noexcept { return count_; }

std::size_t UnivariateSummary::count_null() const noexcept { return null_count_; }

std::size_t UnivariateSummary::count_total() const noexcept { return count_ + null_count_; }

double UnivariateSummary::min() const noexcept { return is_empty() ? not_a_number : min_; }

double UnivariateSummary::max() const noexcept { return is_empty() ? not_a_number : max_; }

double UnivariateSummary::sum() const noexcept { return sum_; }

double UnivariateSummary::average() const noexcept {
    return is_empty() ? not_a_number : sum_ / static_cast<double>(count_);
}

double UnivariateSummary::variance() const noexcept {
    if (count_ < 2) {
        return not_a_number;
    }

    return squares_ / static_cast<double>(count_ - 1);
}

double UnivariateSummary::std_deviation() const noexcept { return std::sqrt(variance()); }

void UnivariateSummary::clear() noexcept {
    count_ = 0;
    null_count_ = 0;
    sum_ = 0.0;
    mean_ = 0.0;
    squares_ = 0.0;
}

void UnivariateSummary::append(double value) noexcept {
    if (is_empty()) {
        min_ = value;
        max_ = value;
    } else {
        min_ = std::min(min_, value);
        max_ = std::max(max_, value);
    }

    count_++;
    sum_ += value;
    auto delta = value - mean_;
    mean_ += delta / static_cast<double>(count_);
    squares_ += delta * (value - mean_);
}

void UnivariateSummary::append(const std::optional<double> &option) noexcept {
    if (option.has_value()) {
        append(option.value());
    } else {
        append_null();
    }
}

void UnivariateSummary::append(const std::vector<double> &values) noexcept {
    for (const auto value : values) {
        append(value);
    }
}

void UnivariateSummary::append_null() noexcept { null_count_++; }

} // namespace drisk::core
