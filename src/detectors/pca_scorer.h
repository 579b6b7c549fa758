#pragma once

#include <string>
#include <vector>

#include "detectors/capabilities.h"
#include "detectors/pca_model.h"

namespace csvsentry::anomaly {

// Flags the contamination share of rows with the largest PCA reconstruction
// error. Refitted on every call; deterministic for a given matrix.
class PcaScorer : public IScorer {
public:
    // Throws std::invalid_argument unless contamination is in (0, 0.5].
    explicit PcaScorer(double contamination = 0.1, PcaFitOptions options = {});

    [[nodiscard]] auto Name() const -> std::string override { return "pca_reconstruction"; }
    auto FitAndScore(const pipeline::FeatureMatrix& matrix) const -> ScoreResult override;

    [[nodiscard]] auto Contamination() const -> double { return contamination_; }

private:
    double contamination_;
    PcaFitOptions options_;
};

// Per-feature signed squared residual of the same PCA fit. The base value is
// the mean reconstruction error over all rows.
class PcaResidualExplainer : public IExplainer {
public:
    explicit PcaResidualExplainer(PcaFitOptions options = {}) : options_(options) {}

    auto Explain(const pipeline::FeatureMatrix& matrix, const std::vector<size_t>& rows) const
        -> std::vector<RowExplanation> override;

private:
    PcaFitOptions options_;
};

} // namespace csvsentry::anomaly
