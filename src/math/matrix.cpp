#include "matrix.hpp"
#include <cmath>
#include <utility>

namespace culturerank {

double determinant(const Matrix& matrix, double regularization) {
    const size_t n = matrix.size();
    if (n == 0) return 1.0;
    if (n == 1) return matrix[0][0] + regularization;
    if (n == 2) {
        double a = matrix[0][0] + regularization;
        double d = matrix[1][1] + regularization;
        return a * d - matrix[0][1] * matrix[1][0];
    }

    Matrix lu = matrix;
    for (size_t i = 0; i < n; i++) lu[i][i] += regularization;

    double det = 1.0;
    size_t swaps = 0;

    for (size_t i = 0; i < n; i++) {
        size_t pivot = i;
        double max_val = std::fabs(lu[i][i]);
        for (size_t k = i + 1; k < n; k++) {
            if (std::fabs(lu[k][i]) > max_val) {
                max_val = std::fabs(lu[k][i]);
                pivot = k;
            }
        }

        if (pivot != i) {
            std::swap(lu[i], lu[pivot]);
            swaps++;
        }

        // Near-singular
        if (std::fabs(lu[i][i]) < kPivotZeroThreshold) return 0.0;

        det *= lu[i][i];

        for (size_t k = i + 1; k < n; k++) {
            double factor = lu[k][i] / lu[i][i];
            for (size_t j = i + 1; j < n; j++) {
                lu[k][j] -= factor * lu[i][j];
            }
            lu[k][i] = 0.0;
        }
    }

    return swaps % 2 == 0 ? det : -det;
}

Matrix principal_submatrix(const Matrix& m, const std::vector<size_t>& indices) {
    Matrix sub(indices.size(), std::vector<double>(indices.size(), 0.0));
    for (size_t r = 0; r < indices.size(); r++) {
        size_t i = indices[r];
        if (i >= m.size()) continue;
        for (size_t c = 0; c < indices.size(); c++) {
            size_t j = indices[c];
            if (j >= m[i].size()) continue;
            double v = m[i][j];
            sub[r][c] = std::isfinite(v) ? v : 0.0;
        }
    }
    return sub;
}

} // namespace culturerank
