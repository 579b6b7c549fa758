#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "pipeline/table.h"

namespace csvsentry::pipeline {

struct ValuePolicyResult {
    size_t original_rows = 0;
    size_t remaining_rows = 0;
    size_t rows_removed = 0;
    size_t infinite_values_replaced = 0;
};

class ValuePolicy {
public:
    // Replaces +-infinity in the given numeric columns with missing, then drops
    // every row missing a value in any of them. No imputation.
    // Throws PipelineError(AllRowsInvalid) when nothing survives.
    static auto Apply(Table& table, const std::vector<std::string>& numeric_columns) -> ValuePolicyResult;
};

} // namespace csvsentry::pipeline
