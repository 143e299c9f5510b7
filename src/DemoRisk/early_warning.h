#pragma once

#include "parameters.h"
#include "scoring_stage.h"
#include "severity.h"

#include <functional>
#include <string>
#include <vector>

namespace drisk {

/// @brief Record values voted on by the early warning signals
struct WarningInputs {
    Severity severity{Severity::normal};
    double persistence{};
    double shock_score{};
    double peer_deviation{};
};

/// @brief Tagged early warning signal
struct WarningSignal {
    /// @brief The signal name
    std::string name;

    /// @brief The signal predicate, one vote when it holds
    std::function<bool(const WarningInputs &)> fires;
};

/// @brief Flags pre-severe records supported by multiple independent signals
///
/// @details A record is an early warning when at least @c min_votes signals fire and the
/// record is not already SEVERE, so early warnings and SEVERE records never overlap.
class EarlyWarningDetector final : public ScoringStage {
  public:
    /// @brief Initialise a new instance of the EarlyWarningDetector class.
    /// @param parameters The voting rule parameters
    explicit EarlyWarningDetector(EarlyWarningParameters parameters);

    ScoringStageType type() const noexcept override;

    const std::string &name() const noexcept override;

    void apply(core::DataTable &table) const override;

    /// @brief Gets the early warning signals
    const std::vector<WarningSignal> &signals() const noexcept;

    /// @brief Counts the signals firing for a record
    /// @param inputs The record values
    /// @return The number of votes
    int votes(const WarningInputs &inputs) const;

    /// @brief Determines whether a record is an early warning
    /// @param inputs The record values
    /// @return true for early warning records; otherwise, false.
    bool is_warning(const WarningInputs &inputs) const;

  private:
    int min_votes_;
    std::vector<WarningSignal> signals_;
    std::string name_{"Early Warning"};
};

} // namespace drisk
