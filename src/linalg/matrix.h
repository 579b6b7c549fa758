#pragma once

#include <cstddef>
#include <vector>

namespace csvsentry::linalg {

using Vector = std::vector<double>;

// Dense row-major matrix.
struct Matrix {
    size_t rows = 0;
    size_t cols = 0;
    std::vector<double> data;

    Matrix() = default;
    Matrix(size_t r, size_t c);

    auto operator()(size_t r, size_t c) -> double&;
    auto operator()(size_t r, size_t c) const -> double;

    [[nodiscard]] auto Row(size_t r) const -> Vector;
    [[nodiscard]] auto Col(size_t c) const -> Vector;
};

struct EigenSymResult {
    Vector eigenvalues;
    Matrix eigenvectors; // columns are eigenvectors
    int sweeps = 0;
};

auto identity(size_t n) -> Matrix;
auto transpose(const Matrix& m) -> Matrix;
auto matmul(const Matrix& a, const Matrix& b) -> Matrix;
auto matvec(const Matrix& a, const Vector& x) -> Vector;

auto dot(const Vector& a, const Vector& b) -> double;

auto argsort_desc(const Vector& v) -> std::vector<size_t>;

auto mean(const Vector& v) -> double;
// n-1 denominator; NaN when fewer than two values.
auto sample_stddev(const Vector& v) -> double;
// Linear interpolation between closest ranks, pct in [0, 100].
auto percentile(Vector v, double pct) -> double;

// Cyclic Jacobi rotations until the off-diagonal norm drops below eps.
auto eigen_sym_jacobi(const Matrix& a, int max_sweeps, double eps) -> EigenSymResult;

} // namespace csvsentry::linalg
