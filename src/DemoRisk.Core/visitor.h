#pragma once

#include "forward_type.h"

namespace drisk::core {

/// @brief DataTable column visitor interface, one overload per column value type
class DataTableColumnVisitor {
  public:
    DataTableColumnVisitor() = default;
    DataTableColumnVisitor(const DataTableColumnVisitor &) = delete;
    DataTableColumnVisitor &operator=(const DataTableColumnVisitor &) = delete;
    DataTableColumnVisitor(DataTableColumnVisitor &&) = delete;
    DataTableColumnVisitor &operator=(DataTableColumnVisitor &&) = delete;
    virtual ~DataTableColumnVisitor() = default;

    virtual void visit(const StringDataTableColumn &column) = 0;

    virtual void visit(const DoubleDataTableColumn &column) = 0;

    virtual void visit(const IntegerDataTableColumn &column) = 0;
};
} // namespace drisk::core
