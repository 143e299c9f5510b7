#pragma once
#include "poco.h"

#include "DemoRisk/parameters.h"

#include <nlohmann/json.hpp>

/// @brief Configuration file serialisation / de-serialisation mapping specific
/// to the `JSON for Modern C++` library.
///
/// @details The scoring parameters are read field by field, an absent field keeps
/// the default value.
///
/// @sa https://github.com/nlohmann/json#arbitrary-types-conversions
/// for details about the contents and code structure in this file.
namespace drisk {
using json = nlohmann::json;

//--------------------------------------------------------
// Scoring parameters mapping
//--------------------------------------------------------

void to_json(json &j, const AnomalyModelParameters &p);
void from_json(const json &j, AnomalyModelParameters &p);

void to_json(json &j, const SeverityParameters &p);
void from_json(const json &j, SeverityParameters &p);

void to_json(json &j, const ExplainabilityThresholds &p);
void from_json(const json &j, ExplainabilityThresholds &p);

void to_json(json &j, const ImpactWeights &p);
void from_json(const json &j, ImpactWeights &p);

void to_json(json &j, const PolicyThresholds &p);
void from_json(const json &j, PolicyThresholds &p);

void to_json(json &j, const EarlyWarningParameters &p);
void from_json(const json &j, EarlyWarningParameters &p);

void to_json(json &j, const TrustWeights &p);
void from_json(const json &j, TrustWeights &p);

void to_json(json &j, const ScoringParameters &p);
void from_json(const json &j, ScoringParameters &p);
} // namespace drisk

namespace drisk::input {
using json = nlohmann::json;

//--------------------------------------------------------
// Configuration sections mapping
//--------------------------------------------------------

// Input files information
void to_json(json &j, const FileInfo &p);

// Output information
void from_json(const json &j, OutputInfo &p);
} // namespace drisk::input
