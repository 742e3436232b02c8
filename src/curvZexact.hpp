#ifndef CURVZEXACT_HPP
#define CURVZEXACT_HPP

#include <vector>
#include <string>
#include "curvZtypes.hpp"

// Exact solvers: each needs exactly as many distinct points as the curve has
// free parameters and reports DuplicatePoints / WrongPointCount /
// DegenerateGeometry / InvalidCoefficients through FitResult.

// Points that repeat an earlier (x, y) pair, in input order.
std::vector<DataPoint> find_duplicate_points(const std::vector<DataPoint>& points);

// y = a x^degree + ... ; degree 1..3, coefficients named a (highest power), b, c, d.
FitResult fit_polynomial(const std::vector<DataPoint>& points, int degree, bool use_fractions = true);

FitResult fit_linear(const std::vector<DataPoint>& points, bool use_fractions = true);
FitResult fit_quadratic(const std::vector<DataPoint>& points, bool use_fractions = true);
FitResult fit_cubic(const std::vector<DataPoint>& points, bool use_fractions = true);

// (x-h)² + (y-k)² = r² through exactly 3 points.
FitResult fit_circle(const std::vector<DataPoint>& points, bool use_fractions = true);

// (x-h)²/a² + (y-k)²/b² = 1 through exactly 4 points.
FitResult fit_ellipse_exact(const std::vector<DataPoint>& points, bool use_fractions = true);

enum class ConicClass { Parabola, Hyperbola, Circle, Ellipse };

constexpr double kConicClassTolerance = 1e-8;

// Classification by the discriminant B² - 4AC of a normalised conic.
ConicClass classify_conic(double A, double B, double C, double tolerance = kConicClassTolerance);
const char* conic_class_name(ConicClass conic_class);

// Ax² + Bxy + Cy² + Dx + Ey + F = 0 through exactly 5 points.
FitResult fit_conic(const std::vector<DataPoint>& points, bool use_fractions = true);

#endif // CURVZEXACT_HPP
