#include "early_warning.h"
#include "output_schema.h"
#include "table_helpers.h"

#include "DemoRisk.Core/typed_column.h"

#include <algorithm>
#include <cmath>

namespace drisk {

EarlyWarningDetector::EarlyWarningDetector(EarlyWarningParameters parameters)
    : min_votes_{parameters.min_votes},
      signals_{
          {"suspicious",
           [](const WarningInputs &in) { return in.severity == Severity::suspicious; }},
          {"persistence",
           [limit = parameters.persistence](const WarningInputs &in) {
               return in.persistence >= limit;
           }},
          {"shock",
           [limit = parameters.shock_score](const WarningInputs &in) {
               return std::abs(in.shock_score) >= limit;
           }},
          {"peer_deviation",
           [limit = parameters.peer_deviation](const WarningInputs &in) {
               return std::abs(in.peer_deviation) >= limit;
           }},
      } {}

ScoringStageType EarlyWarningDetector::type() const noexcept {
    return ScoringStageType::EarlyWarning;
}

const std::string &EarlyWarningDetector::name() const noexcept { return name_; }

const std::vector<WarningSignal> &EarlyWarningDetector::signals() const noexcept {
    return signals_;
}

int EarlyWarningDetector::votes(const WarningInputs &inputs) const {
    return static_cast<int>(std::count_if(signals_.cbegin(), signals_.cend(),
                                          [&inputs](const auto &s) { return s.fires(inputs); }));
}

bool EarlyWarningDetector::is_warning(const WarningInputs &inputs) const {
    return inputs.severity != Severity::severe && votes(inputs) >= min_votes_;
}

void EarlyWarningDetector::apply(core::DataTable &table) const {
    using core::DoubleDataTableColumn;
    const auto levels = column_values<core::StringDataTableColumn>(table, columns::severity);
    const auto persistence = column_values<DoubleDataTableColumn>(table, columns::persistence);
    const auto shock = column_values<DoubleDataTableColumn>(table, columns::shock_score);
    const auto deviation = column_values<DoubleDataTableColumn>(table, columns::peer_deviation);

    auto warnings = std::vector<int>{};
    warnings.reserve(levels.size());
    for (std::size_t row = 0; row < levels.size(); row++) {
        auto inputs = WarningInputs{.severity = parse_severity(levels[row]),
                                    .persistence = persistence[row],
                                    .shock_score = shock[row],
                                    .peer_deviation = deviation[row]};
        warnings.push_back(is_warning(inputs) ? 1 : 0);
    }

    table.add(
        std::make_unique<core::IntegerDataTableColumn>(columns::early_warning, std::move(warnings)));
}

} // namespace drisk
