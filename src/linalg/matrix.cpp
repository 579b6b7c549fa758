#include "linalg/matrix.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace csvsentry::linalg {

Matrix::Matrix(size_t r, size_t c) : rows(r), cols(c), data(r * c, 0.0) {}

auto Matrix::operator()(size_t r, size_t c) -> double& {
    return data[r * cols + c];
}

auto Matrix::operator()(size_t r, size_t c) const -> double {
    return data[r * cols + c];
}

auto Matrix::Row(size_t r) const -> Vector {
    auto begin = data.begin() + static_cast<std::ptrdiff_t>(r * cols);
    return Vector(begin, begin + static_cast<std::ptrdiff_t>(cols));
}

auto Matrix::Col(size_t c) const -> Vector {
    Vector out(rows, 0.0);
    for (size_t r = 0; r < rows; ++r) {
        out[r] = data[r * cols + c];
    }
    return out;
}

auto identity(size_t n) -> Matrix {
    Matrix m(n, n);
    for (size_t i = 0; i < n; ++i) {
        m(i, i) = 1.0;
    }
    return m;
}

auto transpose(const Matrix& m) -> Matrix {
    Matrix t(m.cols, m.rows);
    for (size_t r = 0; r < m.rows; ++r) {
        for (size_t c = 0; c < m.cols; ++c) {
            t(c, r) = m(r, c);
        }
    }
    return t;
}

auto matmul(const Matrix& a, const Matrix& b) -> Matrix {
    if (a.cols != b.rows) {
        throw std::runtime_error("matmul dimension mismatch");
    }
    Matrix out(a.rows, b.cols);
    for (size_t i = 0; i < a.rows; ++i) {
        for (size_t k = 0; k < a.cols; ++k) {
            double av = a(i, k);
            for (size_t j = 0; j < b.cols; ++j) {
                out(i, j) += av * b(k, j);
            }
        }
    }
    return out;
}

auto matvec(const Matrix& a, const Vector& x) -> Vector {
    if (a.cols != x.size()) {
        throw std::runtime_error("matvec dimension mismatch");
    }
    Vector out(a.rows, 0.0);
    for (size_t i = 0; i < a.rows; ++i) {
        double sum = 0.0;
        for (size_t j = 0; j < a.cols; ++j) {
            sum += a(i, j) * x[j];
        }
        out[i] = sum;
    }
    return out;
}

auto dot(const Vector& a, const Vector& b) -> double {
    if (a.size() != b.size()) {
        throw std::runtime_error("dot dimension mismatch");
    }
    double sum = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        sum += a[i] * b[i];
    }
    return sum;
}

auto argsort_desc(const Vector& v) -> std::vector<size_t> {
    std::vector<size_t> idx(v.size());
    for (size_t i = 0; i < v.size(); ++i) {
        idx[i] = i;
    }
    std::sort(idx.begin(), idx.end(), [&v](size_t a, size_t b) {
        if (v[a] == v[b]) {
            return a < b;
        }
        return v[a] > v[b];
    });
    return idx;
}

auto mean(const Vector& v) -> double {
    if (v.empty()) {
        return std::numeric_limits<double>::quiet_NaN();
    }
    double sum = 0.0;
    for (double x : v) {
        sum += x;
    }
    return sum / static_cast<double>(v.size());
}

auto sample_stddev(const Vector& v) -> double {
    if (v.size() < 2) {
        return std::numeric_limits<double>::quiet_NaN();
    }
    double m = mean(v);
    double ss = 0.0;
    for (double x : v) {
        double d = x - m;
        ss += d * d;
    }
    return std::sqrt(ss / static_cast<double>(v.size() - 1));
}

auto percentile(Vector v, double pct) -> double {
    if (v.empty()) {
        throw std::runtime_error("percentile requires non-empty input");
    }
    if (!(pct >= 0.0 && pct <= 100.0)) {
        throw std::invalid_argument("percentile must be within [0, 100]");
    }
    std::sort(v.begin(), v.end());
    double rank = (pct / 100.0) * static_cast<double>(v.size() - 1);
    auto lo = static_cast<size_t>(std::floor(rank));
    auto hi = static_cast<size_t>(std::ceil(rank));
    if (hi >= v.size()) hi = v.size() - 1;
    double frac = rank - static_cast<double>(lo);
    return v[lo] + (v[hi] - v[lo]) * frac;
}

static auto offdiag_norm(const Matrix& a) -> double {
    double sum = 0.0;
    for (size_t i = 0; i < a.rows; ++i) {
        for (size_t j = i + 1; j < a.cols; ++j) {
            sum += 2.0 * a(i, j) * a(i, j);
        }
    }
    return std::sqrt(sum);
}

// NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
auto eigen_sym_jacobi(const Matrix& a, int max_sweeps, double eps) -> EigenSymResult {
    if (a.rows != a.cols) {
        throw std::runtime_error("eigen_sym_jacobi requires square matrix");
    }
    size_t n = a.rows;
    Matrix v = identity(n);
    Matrix d = a;

    int sweep = 0;
    for (; sweep < max_sweeps; ++sweep) {
        if (offdiag_norm(d) < eps) {
            break;
        }
        for (size_t p = 0; p + 1 < n; ++p) {
            for (size_t q = p + 1; q < n; ++q) {
                double apq = d(p, q);
                if (apq == 0.0) {
                    continue;
                }
                double theta = (d(q, q) - d(p, p)) / (2.0 * apq);
                double t = (theta >= 0.0 ? 1.0 : -1.0) / (std::abs(theta) + std::sqrt(theta * theta + 1.0));
                double c = 1.0 / std::sqrt(t * t + 1.0);
                double s = t * c;

                for (size_t k = 0; k < n; ++k) {
                    double dkp = d(k, p);
                    double dkq = d(k, q);
                    d(k, p) = c * dkp - s * dkq;
                    d(k, q) = s * dkp + c * dkq;
                }
                for (size_t k = 0; k < n; ++k) {
                    double dpk = d(p, k);
                    double dqk = d(q, k);
                    d(p, k) = c * dpk - s * dqk;
                    d(q, k) = s * dpk + c * dqk;
                }
                d(p, q) = 0.0;
                d(q, p) = 0.0;

                for (size_t k = 0; k < n; ++k) {
                    double vkp = v(k, p);
                    double vkq = v(k, q);
                    v(k, p) = c * vkp - s * vkq;
                    v(k, q) = s * vkp + c * vkq;
                }
            }
        }
    }

    Vector eigenvalues(n, 0.0);
    for (size_t i = 0; i < n; ++i) {
        eigenvalues[i] = d(i, i);
    }

    return EigenSymResult{eigenvalues, v, sweep};
}

} // namespace csvsentry::linalg
