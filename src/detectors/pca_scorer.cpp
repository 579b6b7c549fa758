#include "detectors/pca_scorer.h"

#include <cmath>
#include <stdexcept>

#include "linalg/matrix.h"

namespace csvsentry::anomaly {

PcaScorer::PcaScorer(double contamination, PcaFitOptions options)
    : contamination_(contamination), options_(options) {
    if (!(contamination_ > 0.0 && contamination_ <= 0.5)) {
        throw std::invalid_argument("contamination must be within (0, 0.5]");
    }
}

auto PcaScorer::FitAndScore(const pipeline::FeatureMatrix& matrix) const -> ScoreResult {
    PcaModel model = PcaModel::Fit(matrix.values, options_);

    ScoreResult result;
    result.scores.reserve(matrix.Rows());
    for (size_t r = 0; r < matrix.Rows(); ++r) {
        result.scores.push_back(model.ReconstructionError(matrix.values.Row(r)));
    }

    double threshold = linalg::percentile(result.scores, 100.0 * (1.0 - contamination_));
    result.labels.reserve(result.scores.size());
    for (double s : result.scores) {
        result.labels.push_back(s > threshold ? 1 : 0);
    }
    return result;
}

auto PcaResidualExplainer::Explain(const pipeline::FeatureMatrix& matrix, const std::vector<size_t>& rows) const
    -> std::vector<RowExplanation> {
    PcaModel model = PcaModel::Fit(matrix.values, options_);

    double total = 0.0;
    for (size_t r = 0; r < matrix.Rows(); ++r) {
        total += model.ReconstructionError(matrix.values.Row(r));
    }
    double base_value = total / static_cast<double>(matrix.Rows());

    std::vector<RowExplanation> out;
    out.reserve(rows.size());
    for (size_t row : rows) {
        if (row >= matrix.Rows()) {
            throw std::out_of_range("explained row " + std::to_string(row) + " is outside the matrix");
        }
        linalg::Vector x = matrix.values.Row(row);
        linalg::Vector residual = model.Residuals(x);
        RowExplanation explanation;
        explanation.base_value = base_value;
        explanation.features.reserve(x.size());
        for (size_t c = 0; c < x.size(); ++c) {
            explanation.features.push_back(
                FeatureAttribution{matrix.feature_names[c], x[c], residual[c] * std::abs(residual[c])});
        }
        out.push_back(std::move(explanation));
    }
    return out;
}

} // namespace csvsentry::anomaly
