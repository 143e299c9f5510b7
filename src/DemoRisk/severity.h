#pragma once

#include "parameters.h"
#include "scoring_stage.h"

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace drisk {

/// @brief Record severity levels enumeration
enum class Severity : uint8_t {
    /// @brief No anomaly
    normal,

    /// @brief Flagged as outlier by the anomaly model
    suspicious,

    /// @brief Among the lowest model scores of the run
    severe,
};

/// @brief Converts a severity level to its label
/// @param value The severity level
/// @return The upper-case label, e.g. SEVERE
std::string to_string(Severity value);

/// @brief Parses a severity label
/// @param label The upper-case label
/// @return The severity level
/// @throws std::invalid_argument for unknown labels.
Severity parse_severity(std::string_view label);

/// @brief Tagged severity rule, assigns its level when the predicate holds
struct SeverityRule {
    /// @brief The severity level assigned by this rule
    Severity level;

    /// @brief The rule predicate over model flag and score
    std::function<bool(int flag, double score)> applies;
};

/// @brief Maps the anomaly model output to a severity level
///
/// @details Rules are evaluated in order and later matches override earlier ones:
/// every record starts as NORMAL, outliers become SUSPICIOUS, and scores strictly
/// below the severe percentile of the run become SEVERE regardless of the flag.
class SeverityClassifier final : public ScoringStage {
  public:
    /// @brief Initialise a new instance of the SeverityClassifier class.
    /// @param parameters The severity parameters
    /// @throws std::invalid_argument for percentile outside [0, 100].
    explicit SeverityClassifier(SeverityParameters parameters);

    ScoringStageType type() const noexcept override;

    const std::string &name() const noexcept override;

    void apply(core::DataTable &table) const override;

    /// @brief Creates the ordered severity rules
    /// @param severe_threshold The model score below which a record is severe
    /// @return The rules in evaluation order
    static std::vector<SeverityRule> make_rules(double severe_threshold);

    /// @brief Classifies one record
    /// @param rules The ordered severity rules
    /// @param flag The anomaly model flag
    /// @param score The anomaly model decision score
    /// @return The level of the last matching rule, NORMAL if none matches
    static Severity classify(const std::vector<SeverityRule> &rules, int flag, double score);

  private:
    SeverityParameters parameters_;
    std::string name_{"Severity"};
};

} // namespace drisk
