#pragma once

#include "configuration.h"
#include "csvparser.h"
#include "jsonparser.h"
#include "poco.h"
#include "schema.h"

/// @brief DemoRisk configuration and input records loading namespace
namespace drisk::input {}
