#pragma once

#include "config.h"
#include "detectors/capabilities.h"

namespace csvsentry::anomaly {

// PcaScorer always; the explainer and reconstruction scorer as the detection
// config switches them.
auto MakeDefaultCollaborators(const DetectionConfig& config) -> Collaborators;

} // namespace csvsentry::anomaly
