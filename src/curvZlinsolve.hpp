#ifndef CURVZLINSOLVE_HPP
#define CURVZLINSOLVE_HPP

#include <vector>
#include <string>

struct LinearSolveResult {
    std::vector<double> solution;
    bool success = false;
    bool singular = false;
    std::string message;
};

// Pivots smaller than this are treated as a singular matrix.
constexpr double kSingularPivotTolerance = 1e-14;

// Solves A x = b for a small dense square system (n <= 5 in this program)
// by Gaussian elimination with partial pivoting and back-substitution.
// A must be n x n and b must have n entries.
LinearSolveResult solve_linear_system(
    std::vector<std::vector<double>> A,
    std::vector<double> b
);

#endif // CURVZLINSOLVE_HPP
