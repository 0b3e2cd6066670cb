#pragma once
#include <cstddef>
#include <vector>

namespace culturerank {

using Matrix = std::vector<std::vector<double>>;

constexpr double kPivotZeroThreshold = 1e-10;

// Determinant by LU decomposition with partial pivoting. `regularization`
// is added to every diagonal entry first. A pivot below 1e-10 in magnitude
// yields 0. The empty matrix has determinant 1.
double determinant(const Matrix& matrix, double regularization = 1e-6);

// Principal submatrix of `m` on `indices`, in the order given.
// Out-of-range indices and non-finite entries read as 0.
Matrix principal_submatrix(const Matrix& m, const std::vector<size_t>& indices);

} // namespace culturerank
