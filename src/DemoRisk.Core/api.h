#pragma once

#include "column_builder.h"
#include "column_iterator.h"
#include "datatable.h"
#include "exception.h"
#include "math_util.h"
#include "string_util.h"
#include "typed_column.h"
#include "univariate_summary.h"
#include "version.h"
#include "visitor.h"

namespace drisk {
/// \brief Top-level namespace for DemoRisk Core C++ API
namespace core {}
} // namespace drisk
