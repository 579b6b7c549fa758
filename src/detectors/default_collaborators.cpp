#include "detectors/default_collaborators.h"

#include <memory>

#include <spdlog/spdlog.h>

#include "detectors/frequency_reconstruction_scorer.h"
#include "detectors/pca_scorer.h"

namespace csvsentry::anomaly {

auto MakeDefaultCollaborators(const DetectionConfig& config) -> Collaborators {
    PcaFitOptions options;
    options.variance_retained = config.pca_variance_retained;

    Collaborators collaborators;
    collaborators.scorer = std::make_shared<PcaScorer>(config.contamination, options);
    if (config.explainability_enabled) {
        collaborators.explainer =
            Capability<IExplainer>::Enabled(std::make_shared<PcaResidualExplainer>(options));
    }
    if (config.categorical_enabled) {
        collaborators.reconstruction =
            Capability<IReconstructionScorer>::Enabled(std::make_shared<FrequencyReconstructionScorer>());
    }
    spdlog::info("Detection collaborators: scorer={}, explainer={}, reconstruction={}",
                 collaborators.scorer->Name(),
                 collaborators.explainer.IsEnabled() ? "pca_residual" : "disabled",
                 collaborators.reconstruction.IsEnabled() ? "categorical_frequency" : "disabled");
    return collaborators;
}

} // namespace csvsentry::anomaly
