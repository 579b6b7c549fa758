#include "detectors/pca_model.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>

#include "obs/logging.h"

namespace csvsentry::anomaly {

static void enforce_component_sign(linalg::Vector& v) {
    size_t idx = 0;
    double max_abs = 0.0;
    for (size_t i = 0; i < v.size(); ++i) {
        double abs_val = std::abs(v[i]);
        if (abs_val > max_abs) {
            max_abs = abs_val;
            idx = i;
        }
    }
    if (v[idx] < 0.0) {
        for (double& val : v) {
            val *= -1.0;
        }
    }
}

auto PcaModel::Fit(const linalg::Matrix& x, const PcaFitOptions& options) -> PcaModel {
    if (x.rows == 0 || x.cols == 0) {
        throw std::invalid_argument("PCA requires a non-empty matrix");
    }
    if (!(options.variance_retained > 0.0 && options.variance_retained <= 1.0)) {
        throw std::invalid_argument("variance_retained must be within (0, 1]");
    }

    const size_t n = x.rows;
    const size_t d = x.cols;
    PcaModel model;
    model.mean_.assign(d, 0.0);
    model.scale_.assign(d, 1.0);

    for (size_t c = 0; c < d; ++c) {
        linalg::Vector col = x.Col(c);
        double m = linalg::mean(col);
        double ss = 0.0;
        for (double v : col) {
            ss += (v - m) * (v - m);
        }
        double s = std::sqrt(ss / static_cast<double>(n));
        if (s == 0.0 || !std::isfinite(s)) s = 1.0;
        model.mean_[c] = m;
        model.scale_[c] = s;
    }

    linalg::Matrix z(n, d);
    for (size_t r = 0; r < n; ++r) {
        for (size_t c = 0; c < d; ++c) {
            z(r, c) = (x(r, c) - model.mean_[c]) / model.scale_[c];
        }
    }

    linalg::Matrix cov = linalg::matmul(linalg::transpose(z), z);
    double denom = static_cast<double>(std::max<size_t>(n - 1, 1));
    for (double& v : cov.data) {
        v /= denom;
    }

    auto eig = linalg::eigen_sym_jacobi(cov, options.max_sweeps, options.eps);
    auto order = linalg::argsort_desc(eig.eigenvalues);

    double total = 0.0;
    for (double ev : eig.eigenvalues) {
        if (ev > 0.0) total += ev;
    }

    // At least one direction is left out so the residual carries signal.
    size_t k = 0;
    if (total > 0.0) {
        double cumulative = 0.0;
        while (k < d && cumulative < options.variance_retained * total) {
            cumulative += std::max(0.0, eig.eigenvalues[order[k]]);
            ++k;
        }
    }
    k = std::min(k, d - 1);

    model.components_ = linalg::Matrix(k, d);
    model.explained_variance_.assign(k, 0.0);
    for (size_t i = 0; i < k; ++i) {
        size_t idx = order[i];
        model.explained_variance_[i] = eig.eigenvalues[idx];
        linalg::Vector comp(d, 0.0);
        for (size_t r = 0; r < d; ++r) {
            comp[r] = eig.eigenvectors(r, idx);
        }
        enforce_component_sign(comp);
        for (size_t c = 0; c < d; ++c) {
            model.components_(i, c) = comp[c];
        }
    }

    model.components_t_ = linalg::transpose(model.components_);

    obs::LogEvent(obs::LogLevel::Info, "pca_fit", "pca_model",
                  {{"rows", n}, {"features", d}, {"components", k}, {"jacobi_sweeps", eig.sweeps}});
    return model;
}

auto PcaModel::Residuals(const linalg::Vector& x) const -> linalg::Vector {
    if (x.size() != mean_.size()) {
        throw std::invalid_argument("PCA residual dimension mismatch");
    }
    linalg::Vector z(x.size(), 0.0);
    for (size_t i = 0; i < x.size(); ++i) {
        z[i] = (x[i] - mean_[i]) / scale_[i];
    }
    if (components_.rows == 0) {
        return z;
    }
    linalg::Vector proj = linalg::matvec(components_, z);
    linalg::Vector recon = linalg::matvec(components_t_, proj);
    for (size_t i = 0; i < z.size(); ++i) {
        z[i] -= recon[i];
    }
    return z;
}

auto PcaModel::ReconstructionError(const linalg::Vector& x) const -> double {
    linalg::Vector r = Residuals(x);
    return linalg::dot(r, r);
}

} // namespace csvsentry::anomaly
