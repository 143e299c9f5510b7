#include "severity.h"
#include "anomaly_detector.h"
#include "output_schema.h"
#include "table_helpers.h"

#include "DemoRisk.Core/typed_column.h"
#include "DemoRisk.Core/math_util.h"

#include <fmt/format.h>

#include <stdexcept>

namespace drisk {

std::string to_string(Severity value) {
    switch (value) {
    case Severity::normal:
        return "NORMAL";
    case Severity::suspicious:
        return "SUSPICIOUS";
    case Severity::severe:
        return "SEVERE";
    }

    throw std::invalid_argument("Unknown severity level.");
}

Severity parse_severity(std::string_view label) {
    if (label == "NORMAL") {
        return Severity::normal;
    }
    if (label == "SUSPICIOUS") {
        return Severity::suspicious;
    }
    if (label == "SEVERE") {
        return Severity::severe;
    }

    throw std::invalid_argument(fmt::format("Unknown severity label: {}.", label));
}

SeverityClassifier::SeverityClassifier(SeverityParameters parameters) : parameters_{parameters} {
    if (!(parameters_.severe_percentile >= 0.0 && parameters_.severe_percentile <= 100.0)) {
        throw std::invalid_argument(fmt::format(
            "Severe percentile must be in the range [0, 100], actual: {}.",
            parameters_.severe_percentile));
    }
}

ScoringStageType SeverityClassifier::type() const noexcept { return ScoringStageType::Severity; }

const std::string &SeverityClassifier::name() const noexcept { return name_; }

std::vector<SeverityRule> SeverityClassifier::make_rules(double severe_threshold) {
    return {
        {Severity::normal, [](int, double) { return true; }},
        {Severity::suspicious, [](int flag, double) { return flag == outlier_flag; }},
        {Severity::severe,
         [severe_threshold](int, double score) { return score < severe_threshold; }},
    };
}

Severity SeverityClassifier::classify(const std::vector<SeverityRule> &rules, int flag,
                                      double score) {
    auto level = Severity::normal;
    for (const auto &rule : rules) {
        if (rule.applies(flag, score)) {
            level = rule.level;
        }
    }

    return level;
}

void SeverityClassifier::apply(core::DataTable &table) const {
    const auto flags = column_values<core::IntegerDataTableColumn>(table, columns::ml_flag);
    const auto scores = column_values<core::DoubleDataTableColumn>(table, columns::ml_score);

    auto levels = std::vector<std::string>{};
    levels.reserve(scores.size());
    if (!scores.empty()) {
        auto threshold = core::MathHelper::percentile(scores, parameters_.severe_percentile);
        auto rules = make_rules(threshold);
        for (std::size_t row = 0; row < scores.size(); row++) {
            levels.push_back(to_string(classify(rules, flags[row], scores[row])));
        }
    }

    table.add(std::make_unique<core::StringDataTableColumn>(columns::severity, std::move(levels)));
}

} // namespace drisk
