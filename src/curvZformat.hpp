#ifndef CURVZFORMAT_HPP
#define CURVZFORMAT_HPP

#include <string>
#include <vector>

// Coefficients with magnitude below this are treated as zero when rendering.
constexpr double kDisplayZero = 1e-10;

// Nearest simple fraction (denominator <= 100) within tolerance, reduced.
// Falls back to format_number when no denominator matches.
std::string to_fraction(double decimal, double tolerance = 0.0001);

// Integer when within 10^-precision of one, short decimal when it has at most
// min(3, precision) significant decimals, otherwise fixed at `precision` decimals.
std::string format_number(double num, int precision = 4);

// show_sign renders " + v" / " - |v|" and returns "" for zero; without it zero is "0".
std::string format_coefficient(double num, bool show_sign = false, bool use_fractions = true, int precision = 4);

struct PolynomialTerm {
    double coef = 0.0;
    std::string term; // "x³", "x²", "x" or "" for the constant
};

// "y = 2x² - x + 1/2"; "y = 0" when every term vanishes.
std::string build_polynomial_equation(const std::vector<PolynomialTerm>& terms, bool use_fractions);

std::string build_circle_equation(double h, double k, double r, bool use_fractions);

// Human form "(x - h)²/a² + (y - k)²/b² = 1".
std::string build_ellipse_equation(double h, double k, double a, double b, bool use_fractions);

// LaTeX form used by graphing front ends.
std::string build_ellipse_latex(double h, double k, double a, double b, bool use_fractions);

// "Ax² + Bxy + Cy² + Dx + Ey + F = 0" with vanishing terms dropped.
std::string build_conic_equation(double A, double B, double C, double D, double E, double F, bool use_fractions);

// y = a * f(bx + c) + d where f is "sin", "ln" or "e^".
std::string build_transcendental_equation(const std::string& function_name,
                                          double a, double b, double c, double d,
                                          bool use_fractions);

#endif // CURVZFORMAT_HPP
