#pragma once

#include <cstddef>
#include <vector>

#include "linalg/matrix.h"

namespace csvsentry::anomaly {

struct PcaFitOptions {
    double variance_retained = 0.9;
    int max_sweeps = 100;
    double eps = 1e-12;
};

// Principal components of a standardized feature matrix, fitted per request.
class PcaModel {
public:
    // Throws std::invalid_argument for an empty matrix or a share outside (0, 1].
    static auto Fit(const linalg::Matrix& x, const PcaFitOptions& options = {}) -> PcaModel;

    // Standardized-space residual of one raw row.
    [[nodiscard]] auto Residuals(const linalg::Vector& x) const -> linalg::Vector;
    // Squared L2 norm of the residual.
    [[nodiscard]] auto ReconstructionError(const linalg::Vector& x) const -> double;

    [[nodiscard]] auto ComponentCount() const -> size_t { return components_.rows; }
    [[nodiscard]] auto Dimension() const -> size_t { return mean_.size(); }
    [[nodiscard]] auto ExplainedVariance() const -> const linalg::Vector& { return explained_variance_; }

private:
    PcaModel() = default;

    linalg::Vector mean_;
    linalg::Vector scale_;
    linalg::Matrix components_;   // k x d
    linalg::Matrix components_t_; // d x k
    linalg::Vector explained_variance_;
};

} // namespace csvsentry::anomaly
