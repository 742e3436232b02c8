#include "curvZlinsolve.hpp"
#include <cmath>   // For std::abs
#include <utility> // For std::swap

LinearSolveResult solve_linear_system(
    std::vector<std::vector<double>> A,
    std::vector<double> b) {

    LinearSolveResult result;
    const size_t n = b.size();

    if (n == 0 || A.size() != n) {
        result.message = "Coefficient matrix and right-hand side sizes do not match.";
        return result;
    }
    for (const auto& row : A) {
        if (row.size() != n) {
            result.message = "Coefficient matrix is not square.";
            return result;
        }
    }

    // Forward elimination
    for (size_t col = 0; col < n; ++col) {
        size_t pivot_row = col;
        for (size_t r = col + 1; r < n; ++r) {
            if (std::abs(A[r][col]) > std::abs(A[pivot_row][col])) {
                pivot_row = r;
            }
        }
        if (pivot_row != col) {
            std::swap(A[pivot_row], A[col]);
            std::swap(b[pivot_row], b[col]);
        }

        // NaN pivots fail this comparison too
        if (!(std::abs(A[col][col]) >= kSingularPivotTolerance)) {
            result.singular = true;
            result.message = "Matrix is singular or nearly singular (pivot " + std::to_string(A[col][col]) +
                             " in column " + std::to_string(col) + ").";
            return result;
        }

        for (size_t r = col + 1; r < n; ++r) {
            const double factor = A[r][col] / A[col][col];
            for (size_t c = col; c < n; ++c) {
                A[r][c] -= factor * A[col][c];
            }
            b[r] -= factor * b[col];
        }
    }

    // Back substitution
    result.solution.assign(n, 0.0);
    for (size_t i = n; i-- > 0;) {
        double value = b[i];
        for (size_t j = i + 1; j < n; ++j) {
            value -= A[i][j] * result.solution[j];
        }
        result.solution[i] = value / A[i][i];
    }

    result.success = true;
    result.message = std::to_string(n) + "x" + std::to_string(n) + " system solved.";
    return result;
}
