#include "detectors/frequency_reconstruction_scorer.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <unordered_map>

namespace csvsentry::anomaly {

auto FrequencyReconstructionScorer::FitAndScore(const pipeline::Table& categorical) const
    -> ReconstructionResult {
    const size_t rows = categorical.RowCount();
    if (rows == 0) {
        throw std::invalid_argument("categorical table has no rows");
    }

    ReconstructionResult result;
    result.features = categorical.ColumnNames();
    result.total_loss.assign(rows, 0.0);
    result.feature_losses.assign(rows, std::vector<double>(categorical.ColumnCount(), 0.0));

    const auto& columns = categorical.Columns();
    for (size_t c = 0; c < columns.size(); ++c) {
        const auto& column = columns[c];
        if (column.IsNumeric()) {
            throw std::invalid_argument("column '" + column.name + "' is not categorical");
        }
        std::unordered_map<std::string, size_t> counts;
        for (const auto& cell : column.texts) {
            if (!cell) {
                throw std::invalid_argument("column '" + column.name + "' has an unfilled missing value");
            }
            ++counts[*cell];
        }
        for (size_t r = 0; r < rows; ++r) {
            double p = static_cast<double>(counts[*column.texts[r]]) / static_cast<double>(rows);
            double loss = -std::log(std::max(p, kMinProbability));
            result.feature_losses[r][c] = loss;
            result.total_loss[r] += loss;
        }
    }
    return result;
}

} // namespace csvsentry::anomaly
