#pragma once

#include <string>

#include "detectors/capabilities.h"

namespace csvsentry::anomaly {

// Loss of a cell is -ln(p) where p is the empirical frequency of its value in
// the column, clipped below at kMinProbability. Rare values score high.
class FrequencyReconstructionScorer : public IReconstructionScorer {
public:
    static constexpr double kMinProbability = 1e-12;

    [[nodiscard]] auto Name() const -> std::string override { return "categorical_frequency"; }
    auto FitAndScore(const pipeline::Table& categorical) const -> ReconstructionResult override;
};

} // namespace csvsentry::anomaly
