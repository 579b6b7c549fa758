#include "pipeline/feature_preparer.h"

#include <stdexcept>

#include "obs/logging.h"
#include "pipeline/pipeline_error.h"

namespace csvsentry::pipeline {

auto FeaturePreparer::Prepare(const Table& table) -> PreparedFeatures {
    std::vector<const Column*> numeric;
    for (const auto& column : table.Columns()) {
        if (column.IsNumeric()) numeric.push_back(&column);
    }
    if (numeric.empty()) {
        throw PipelineError(ErrorKind::NoNumericColumns, "No numeric columns found in CSV");
    }

    PreparedFeatures prepared;
    std::vector<linalg::Vector> kept;
    for (const Column* column : numeric) {
        linalg::Vector values;
        values.reserve(column->numbers.size());
        for (const auto& cell : column->numbers) {
            if (!cell) {
                throw std::invalid_argument("column '" + column->name + "' still has missing values");
            }
            values.push_back(*cell);
        }
        if (linalg::sample_stddev(values) == 0.0) {
            prepared.dropped_zero_variance.push_back(column->name);
            continue;
        }
        prepared.matrix.feature_names.push_back(column->name);
        kept.push_back(std::move(values));
    }

    if (!prepared.dropped_zero_variance.empty()) {
        obs::LogEvent(obs::LogLevel::Info, "zero_variance_columns_dropped", "feature_preparer",
                      {{"columns", prepared.dropped_zero_variance}});
    }
    if (kept.empty()) {
        throw PipelineError(ErrorKind::AllZeroVariance, "All numeric columns have zero variance");
    }

    size_t rows = table.RowCount();
    linalg::Matrix m(rows, kept.size());
    for (size_t c = 0; c < kept.size(); ++c) {
        for (size_t r = 0; r < rows; ++r) {
            m(r, c) = kept[c][r];
        }
    }
    prepared.matrix.values = std::move(m);
    return prepared;
}

} // namespace csvsentry::pipeline
