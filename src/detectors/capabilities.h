#pragma once

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "pipeline/feature_preparer.h"
#include "pipeline/table.h"

namespace csvsentry::anomaly {

// Row-aligned with the matrix that was scored. labels[i] == 1 marks an anomaly.
struct ScoreResult {
    std::vector<int> labels;
    std::vector<double> scores;
};

struct FeatureAttribution {
    std::string feature;
    double value = 0.0;
    double attribution = 0.0;
};

struct RowExplanation {
    std::optional<double> base_value;
    std::vector<FeatureAttribution> features;
};

struct FeatureLoss {
    std::string feature;
    double loss = 0.0;
};

struct ReconstructionResult {
    std::vector<std::string> features;
    std::vector<double> total_loss;                      // one per row
    std::vector<std::vector<double>> feature_losses;     // [row][feature]
};

class IScorer {
public:
    virtual ~IScorer() = default;
    [[nodiscard]] virtual auto Name() const -> std::string = 0;
    virtual auto FitAndScore(const pipeline::FeatureMatrix& matrix) const -> ScoreResult = 0;
};

class IExplainer {
public:
    virtual ~IExplainer() = default;
    // One explanation per entry of rows, in the same order.
    virtual auto Explain(const pipeline::FeatureMatrix& matrix, const std::vector<size_t>& rows) const
        -> std::vector<RowExplanation> = 0;
};

class IReconstructionScorer {
public:
    virtual ~IReconstructionScorer() = default;
    [[nodiscard]] virtual auto Name() const -> std::string = 0;
    // Every cell of the categorical table is present; missing is pre-filled.
    virtual auto FitAndScore(const pipeline::Table& categorical) const -> ReconstructionResult = 0;
};

// A collaborator that is either configured or explicitly switched off.
template <typename T>
class Capability {
public:
    static auto Disabled() -> Capability { return Capability(); }

    static auto Enabled(std::shared_ptr<const T> impl) -> Capability {
        if (!impl) {
            throw std::invalid_argument("enabled capability requires an implementation");
        }
        Capability c;
        c.impl_ = std::move(impl);
        return c;
    }

    [[nodiscard]] auto IsEnabled() const -> bool { return impl_ != nullptr; }
    [[nodiscard]] auto Get() const -> const T& { return *impl_; }

private:
    Capability() = default;
    std::shared_ptr<const T> impl_;
};

struct Collaborators {
    std::shared_ptr<const IScorer> scorer;
    Capability<IExplainer> explainer = Capability<IExplainer>::Disabled();
    Capability<IReconstructionScorer> reconstruction = Capability<IReconstructionScorer>::Disabled();
};

} // namespace csvsentry::anomaly
