#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "linalg/matrix.h"
#include "pipeline/table.h"

namespace csvsentry::pipeline {

// Model input: one row per surviving table row, one column per feature.
struct FeatureMatrix {
    std::vector<std::string> feature_names;
    linalg::Matrix values;

    [[nodiscard]] auto Rows() const -> size_t { return values.rows; }
    [[nodiscard]] auto Cols() const -> size_t { return values.cols; }
};

struct PreparedFeatures {
    FeatureMatrix matrix;
    std::vector<std::string> dropped_zero_variance;
};

class FeaturePreparer {
public:
    // Numeric columns whose sample standard deviation is exactly zero are
    // dropped; a single-row column has no defined deviation and is kept.
    // Throws PipelineError(NoNumericColumns | AllZeroVariance).
    static auto Prepare(const Table& table) -> PreparedFeatures;
};

} // namespace csvsentry::pipeline
