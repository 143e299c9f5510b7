#pragma once

#include "aggregator.h"
#include "anomaly_detector.h"
#include "anomaly_scoring.h"
#include "early_warning.h"
#include "explainability.h"
#include "feature_builder.h"
#include "feature_scaler.h"
#include "isolation_forest.h"
#include "output_schema.h"
#include "parameters.h"
#include "peer_comparator.h"
#include "policy_engine.h"
#include "risk_composer.h"
#include "sampling_engine.h"
#include "scoring_pipeline.h"
#include "severity.h"
#include "trust_scorer.h"

/// @brief Top-level namespace for DemoRisk C++ API
namespace drisk {}
