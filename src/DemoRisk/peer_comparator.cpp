#include "peer_comparator.h"
#include "output_schema.h"
#include "table_helpers.h"

#include "DemoRisk.Core/typed_column.h"
#include "DemoRisk.Core/math_util.h"

namespace drisk {

ScoringStageType PeerComparator::type() const noexcept { return ScoringStageType::PeerComparison; }

const std::string &PeerComparator::name() const noexcept { return name_; }

void PeerComparator::apply(core::DataTable &table) const {
    const auto youth = column_values<core::DoubleDataTableColumn>(table, columns::youth_ratio);
    auto baseline = broadcast_group_mean(make_group_keys(table, {columns::state}), youth);

    auto deviation = std::vector<double>{};
    deviation.reserve(youth.size());
    for (std::size_t row = 0; row < youth.size(); row++) {
        deviation.push_back(core::MathHelper::round_to(youth[row] - baseline[row], 3));
    }

    table.add(std::make_unique<core::DoubleDataTableColumn>(columns::state_avg_youth_ratio,
                                                            std::move(baseline)));
    table.add(std::make_unique<core::DoubleDataTableColumn>(columns::peer_deviation,
                                                            std::move(deviation)));
}

} // namespace drisk
