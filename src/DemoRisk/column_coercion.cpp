#include "column_coercion.h"

#include "DemoRisk.Core/string_util.h"

#include <fmt/format.h>

#include <cctype>
#include <charconv>
#include <cmath>

namespace drisk {

std::optional<double> parse_number(std::string_view text) noexcept {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }

    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }

    if (!text.empty() && text.front() == '+') {
        text.remove_prefix(1);
    }

    if (text.empty()) {
        return std::nullopt;
    }

    auto value = 0.0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size() || !std::isfinite(value)) {
        return std::nullopt;
    }

    return value;
}

NumericCoercionVisitor::NumericCoercionVisitor(double lower_bound) noexcept
    : lower_bound_{lower_bound} {}

const std::vector<std::optional<double>> &NumericCoercionVisitor::values() const noexcept {
    return values_;
}

std::size_t NumericCoercionVisitor::invalid_count() const noexcept { return invalid_count_; }

void NumericCoercionVisitor::visit(const core::StringDataTableColumn &column) {
    values_.clear();
    values_.reserve(column.size());
    invalid_count_ = 0;
    for (const auto &text : column) {
        if (!text.has_value() || core::trim(text.value()).empty()) {
            values_.emplace_back(std::nullopt);
            continue;
        }

        auto number = parse_number(text.value());
        if (!number.has_value()) {
            invalid_count_++;
            values_.emplace_back(std::nullopt);
            continue;
        }

        values_.emplace_back(check_bound(number.value()));
    }
}

void NumericCoercionVisitor::visit(const core::DoubleDataTableColumn &column) {
    copy_numeric(column);
}

void NumericCoercionVisitor::visit(const core::IntegerDataTableColumn &column) {
    copy_numeric(column);
}

template <typename ColumnType> void NumericCoercionVisitor::copy_numeric(const ColumnType &column) {
    values_.clear();
    values_.reserve(column.size());
    invalid_count_ = 0;
    for (const auto v : column) {
        if (v.has_value() && std::isfinite(static_cast<double>(v.value()))) {
            values_.emplace_back(check_bound(static_cast<double>(v.value())));
        } else {
            values_.emplace_back(std::nullopt);
        }
    }
}

std::optional<double> NumericCoercionVisitor::check_bound(double value) noexcept {
    if (value < lower_bound_) {
        invalid_count_++;
        return std::nullopt;
    }

    return value;
}

const std::vector<std::string> &TextCoercionVisitor::values() const noexcept { return values_; }

void TextCoercionVisitor::visit(const core::StringDataTableColumn &column) {
    values_.clear();
    values_.reserve(column.size());
    for (const auto &text : column) {
        values_.emplace_back(text.has_value() ? core::trim(text.value()) : std::string{});
    }
}

void TextCoercionVisitor::visit(const core::DoubleDataTableColumn &column) {
    format_numeric(column);
}

void TextCoercionVisitor::visit(const core::IntegerDataTableColumn &column) {
    format_numeric(column);
}

template <typename ColumnType> void TextCoercionVisitor::format_numeric(const ColumnType &column) {
    values_.clear();
    values_.reserve(column.size());
    for (const auto v : column) {
        values_.emplace_back(v.has_value() ? fmt::format("{}", v.value()) : std::string{});
    }
}

} // namespace drisk
