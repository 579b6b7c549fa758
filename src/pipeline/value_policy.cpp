#include "pipeline/value_policy.h"

#include <cmath>
#include <stdexcept>

#include "obs/logging.h"
#include "pipeline/pipeline_error.h"

namespace csvsentry::pipeline {

auto ValuePolicy::Apply(Table& table, const std::vector<std::string>& numeric_columns) -> ValuePolicyResult {
    ValuePolicyResult result;
    result.original_rows = table.RowCount();

    std::vector<bool> keep(result.original_rows, true);
    for (const auto& name : numeric_columns) {
        Column* column = table.FindColumn(name);
        if (column == nullptr || !column->IsNumeric()) {
            throw std::invalid_argument("'" + name + "' is not a numeric column");
        }
        for (size_t row = 0; row < column->numbers.size(); ++row) {
            auto& cell = column->numbers[row];
            if (cell && std::isinf(*cell)) {
                cell.reset();
                ++result.infinite_values_replaced;
            }
            if (!cell) {
                keep[row] = false;
            }
        }
    }

    table.RetainRows(keep);
    result.remaining_rows = table.RowCount();
    result.rows_removed = result.original_rows - result.remaining_rows;

    if (result.rows_removed > 0 || result.infinite_values_replaced > 0) {
        obs::LogEvent(obs::LogLevel::Info, "rows_removed", "value_policy",
                      {{"original_rows", result.original_rows},
                       {"rows_removed", result.rows_removed},
                       {"infinite_values_replaced", result.infinite_values_replaced}});
    }
    if (result.remaining_rows == 0) {
        throw PipelineError(ErrorKind::AllRowsInvalid,
                            "No valid data remaining after removing rows with missing values");
    }
    return result;
}

} // namespace csvsentry::pipeline
