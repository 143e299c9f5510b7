#pragma once

#include <array>
#include <string>

/// @brief Column names of the raw input and scored output tables
namespace drisk::columns {

inline const std::string date = "date";
inline const std::string state = "state";
inline const std::string district = "district";
inline const std::string pincode = "pincode";
inline const std::string age_5_17 = "demo_age_5_17";
inline const std::string age_17_plus = "demo_age_17_";

inline const std::string total_population = "total_population";
inline const std::string youth_ratio = "youth_ratio";
inline const std::string pop_change = "pop_change";
inline const std::string shock_score = "shock_score";

inline const std::string ml_flag = "ml_flag";
inline const std::string ml_score = "ml_score";
inline const std::string severity = "severity";
inline const std::string reason = "reason";
inline const std::string confidence = "confidence";
inline const std::string persistence = "persistence";
inline const std::string impact_score = "impact_score";
inline const std::string recommended_action = "recommended_action";
inline const std::string state_avg_youth_ratio = "state_avg_youth_ratio";
inline const std::string peer_deviation = "peer_deviation";
inline const std::string early_warning = "early_warning";
inline const std::string data_trust_score = "data_trust_score";

/// @brief Columns every input file must provide
inline const std::array<std::string, 6> required_input{date,     state,    district,
                                                       pincode, age_5_17, age_17_plus};

/// @brief Features passed to the anomaly model, in matrix column order
inline const std::array<std::string, 4> model_features{total_population, youth_ratio,
                                                       pop_change, shock_score};

/// @brief The scored table column order
inline const std::array<std::string, 22> scored_output{
    date,        state,          district,           pincode,
    age_5_17,    age_17_plus,    total_population,   youth_ratio,
    pop_change,  shock_score,    ml_flag,            ml_score,
    severity,    reason,         confidence,         persistence,
    impact_score, recommended_action, state_avg_youth_ratio, peer_deviation,
    early_warning, data_trust_score};

} // namespace drisk::columns
